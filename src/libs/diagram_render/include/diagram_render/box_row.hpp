#pragma once

#include <diagram_model/types.hpp>
#include <string>
#include <vector>

namespace diagram_render {

// Boxes side by side, `spacing` blank cells apart. Shorter boxes are stretched
// to the tallest one with blank interior lines above their bottom border.
//
// With `merge` and at least two boxes, three lines follow the row: a stem under
// every box center, one horizontal run from the leftmost to the rightmost center
// with a single down tee at the midpoint of that run, and a trunk below the tee.
diagram_model::Diagram render_box_row(const std::vector<std::vector<std::string>>& boxes,
    int spacing = 2,
    bool merge = false);

} // namespace diagram_render
