#pragma once

namespace diagram_layout {

// Shared layout constants for text diagrams (used by the layout engine and the apps).
// All values in monospace cells.

namespace layout {

constexpr int default_width = 60;
constexpr int min_width = 8;
constexpr int max_width = 400;

// Upper bound for any element size, offset or spacing read from a request.
constexpr int max_extent = max_width;

// Blank cells between a box border and its centered content.
constexpr int box_padding = 1;

// A frame costs one border cell and one blank cell on each side.
constexpr int frame_margin = 4;

// Width available to elements once the optional frame is accounted for.
inline constexpr int inner_width(int width, bool frame) {
    if (!frame) return width;
    return width > frame_margin ? width - frame_margin : 0;
}

// Column used by auto-centered vertical arrows; lines up with centered boxes.
inline constexpr int center_column(int inner) {
    return inner / 2;
}

} // namespace layout
} // namespace diagram_layout
