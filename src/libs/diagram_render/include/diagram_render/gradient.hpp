#pragma once

#include <diagram_model/types.hpp>
#include <glyphs/glyph_tables.hpp>
#include <cstddef>
#include <string>

namespace diagram_render {

// Raw shade in [0, 1] for cell (x, y) of a width x height field.
// Radial measures the distance from the center, normalized by the half extents
// and clamped to 1.
double shade_value(diagram_model::ShadeDirection direction, int x, int y, int width, int height);

// contrast < 0.5 squeezes values toward 0.5 by 2 * contrast; contrast >= 0.5
// stretches them away by 2 * (contrast - 0.5) + 1. 0.5 is the identity.
// The result is clamped to [0, 1].
double apply_contrast(double value, double contrast);

// floor(value * (length - 1)), clamped to a valid palette index.
std::size_t palette_index(double value, std::size_t palette_length);

// Bordered rectangle whose width x height interior is filled with palette
// characters following the gradient. A non-empty title is centered in the top border.
diagram_model::Diagram render_shaded_box(int width,
    int height,
    diagram_model::ShadeDirection direction = diagram_model::ShadeDirection::Horizontal,
    const std::string& palette_name = "blocks",
    double contrast = 0.5,
    const glyphs::BoxStyle& style = glyphs::default_box_style(),
    const std::string& title = {});

} // namespace diagram_render
