#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

namespace glyphs {

// Box-drawing glyph set. Every style supplies all eleven glyphs; boxes use the
// corners/edges and connector tees, tables additionally use the side tees and cross.
struct BoxStyle {
    std::string_view name;
    std::string_view horizontal;
    std::string_view vertical;
    std::string_view top_left;
    std::string_view top_right;
    std::string_view bottom_left;
    std::string_view bottom_right;
    std::string_view t_down;   // ┬
    std::string_view t_up;     // ┴
    std::string_view t_right;  // ├
    std::string_view t_left;   // ┤
    std::string_view cross;
};

// Named styles: "light", "heavy", "double", "rounded".
// Unknown names resolve to the light style.
const BoxStyle& box_style(std::string_view name);
const BoxStyle& default_box_style();
const std::vector<std::string_view>& box_style_names();

constexpr std::string_view full_block = "█";   // █
constexpr std::string_view light_shade = "░";  // ░

// Horizontal partial cells: index 0 is a full cell, index 7 is one eighth.
constexpr std::array<std::string_view, 8> fill_ramp = {
    "█", "▉", "▊", "▋", "▌", "▍", "▎", "▏",
};

// Vertical partial cells: index 0 is one eighth, index 7 is a full cell.
constexpr std::array<std::string_view, 8> spark_ramp = {
    "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█",
};

namespace arrows {

constexpr std::string_view down = "▼";   // ▼
constexpr std::string_view up = "▲";     // ▲
constexpr std::string_view left = "◀";   // ◀
constexpr std::string_view right = "▶";  // ▶
constexpr std::string_view vertical = "│";
constexpr std::string_view horizontal = "─";

} // namespace arrows

namespace frame {

constexpr std::string_view top_left = "┌";
constexpr std::string_view top_right = "┐";
constexpr std::string_view bottom_left = "└";
constexpr std::string_view bottom_right = "┘";
constexpr std::string_view horizontal = "╌";  // ╌
constexpr std::string_view vertical = "╎";    // ╎

} // namespace frame

constexpr std::string_view title_fill = "═";      // ═
constexpr std::string_view comment_marker = "  ◀─ ";

// Shading palette, ordered lightest to darkest. Each entry is one cell.
using Palette = std::vector<std::string_view>;

// Named palettes: "blocks", "ascii", "dots", "bars", "minimal".
// Unknown names resolve to "blocks".
const Palette& palette(std::string_view name);
const std::vector<std::string_view>& palette_names();

} // namespace glyphs
