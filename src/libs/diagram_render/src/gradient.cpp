#include <diagram_render/gradient.hpp>
#include <glyphs/text_cells.hpp>
#include <algorithm>
#include <cmath>

namespace diagram_render {

namespace {

double unit_position(int i, int extent) {
    return extent > 1 ? static_cast<double>(i) / static_cast<double>(extent - 1) : 0.0;
}

double radial_shade(int x, int y, int width, int height) {
    const double cx = (width - 1) * 0.5;
    const double cy = (height - 1) * 0.5;
    const double half_w = width * 0.5;
    const double half_h = height * 0.5;
    const double dx = half_w > 0.0 ? (x - cx) / half_w : 0.0;
    const double dy = half_h > 0.0 ? (y - cy) / half_h : 0.0;
    return std::min(1.0, std::sqrt(dx * dx + dy * dy));
}

std::string top_border(const glyphs::BoxStyle& style, int width, const std::string& title) {
    std::string line(style.top_left);
    if (title.empty()) {
        line += glyphs::repeat(style.horizontal, width);
    } else {
        const std::string label = glyphs::truncate(" " + title + " ", width);
        const int pad = width - glyphs::cell_width(label);
        const int left = pad / 2;
        line += glyphs::repeat(style.horizontal, left);
        line += label;
        line += glyphs::repeat(style.horizontal, pad - left);
    }
    line += style.top_right;
    return line;
}

} // namespace

double shade_value(diagram_model::ShadeDirection direction, int x, int y, int width, int height) {
    using diagram_model::ShadeDirection;
    const double fx = unit_position(x, width);
    const double fy = unit_position(y, height);
    switch (direction) {
    case ShadeDirection::Horizontal:
        return fx;
    case ShadeDirection::Vertical:
        return fy;
    case ShadeDirection::Diagonal:
        return (fx + fy) * 0.5;
    case ShadeDirection::DiagonalReverse:
        return ((1.0 - fx) + fy) * 0.5;
    case ShadeDirection::Radial:
        return radial_shade(x, y, width, height);
    }
    return fx;
}

double apply_contrast(double value, double contrast) {
    const double factor = contrast < 0.5 ? 2.0 * contrast : 2.0 * (contrast - 0.5) + 1.0;
    const double adjusted = 0.5 + (value - 0.5) * factor;
    if (!(adjusted > 0.0)) return 0.0;  // also catches NaN
    return std::min(adjusted, 1.0);
}

std::size_t palette_index(double value, std::size_t palette_length) {
    if (palette_length == 0 || !(value > 0.0)) return 0;
    const double scaled = std::floor(value * static_cast<double>(palette_length - 1));
    if (scaled >= static_cast<double>(palette_length - 1)) return palette_length - 1;
    return static_cast<std::size_t>(scaled);
}

diagram_model::Diagram render_shaded_box(int width,
    int height,
    diagram_model::ShadeDirection direction,
    const std::string& palette_name,
    double contrast,
    const glyphs::BoxStyle& style,
    const std::string& title)
{
    const int w = std::max(width, 0);
    const int h = std::max(height, 0);
    const glyphs::Palette& palette = glyphs::palette(palette_name);

    diagram_model::Diagram out;
    out.reserve(static_cast<std::size_t>(h) + 2);
    out.push_back(top_border(style, w, title));
    for (int y = 0; y < h; ++y) {
        std::string row(style.vertical);
        for (int x = 0; x < w; ++x) {
            const double shade = apply_contrast(shade_value(direction, x, y, w, h), contrast);
            row += palette[palette_index(shade, palette.size())];
        }
        row += style.vertical;
        out.push_back(std::move(row));
    }
    out.push_back(std::string(style.bottom_left) + glyphs::repeat(style.horizontal, w) + std::string(style.bottom_right));
    return out;
}

} // namespace diagram_render
