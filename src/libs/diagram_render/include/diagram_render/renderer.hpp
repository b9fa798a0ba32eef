#pragma once

#include <diagram_model/types.hpp>
#include <glyphs/glyph_tables.hpp>
#include <optional>
#include <string>
#include <vector>

namespace diagram_render {

// Bordered box around one or more centered content lines.
// `width` is the total width including borders; without it the box hugs its
// longest line. A set connector flag replaces the middle of the top (bottom)
// border with a down (up) tee so an arrow or merge line can attach.
// All returned lines have the same cell width.
diagram_model::Diagram render_box(const std::vector<std::string>& content,
    std::optional<int> width = std::nullopt,
    int padding = 1,
    bool top_connector = false,
    bool bottom_connector = false,
    const glyphs::BoxStyle& style = glyphs::default_box_style());

// Total width a box with this content would have.
int box_total_width(const std::vector<std::string>& content,
    std::optional<int> width = std::nullopt,
    int padding = 1);

// One-line title bar exactly `width` cells wide (unless the title is wider).
std::string render_title(const std::string& text, int width);

// Dashed frame `width` cells wide around arbitrary content, with one blank
// line of padding above and below. Content lines are padded or cut to width - 4.
// Widths below 4 are drawn 4 wide.
diagram_model::Diagram render_frame(const diagram_model::Diagram& content, int width);

// Side annotation appended to a line.
std::string render_comment(const std::string& comment);

// Vertical arrows put the head on the leading edge (bottom for Down, top for Up).
// Horizontal arrows are a single line.
diagram_model::Diagram render_arrow(diagram_model::ArrowDirection direction, int length);

} // namespace diagram_render
