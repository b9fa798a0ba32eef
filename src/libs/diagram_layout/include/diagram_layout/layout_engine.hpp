#pragma once

#include <diagram_layout/layout_constants.hpp>
#include <diagram_model/types.hpp>
#include <string>
#include <vector>

namespace diagram_layout {

// Render an ordered element list, top to bottom, into text lines.
// `width` is the total width; with `frame` the result is wrapped in a dashed
// frame of that width and elements get width - 4 cells.
// A box directly followed by a downward arrow gets a bottom connector.
// Elements of unknown type render nothing.
diagram_model::Diagram layout_diagram(const std::vector<diagram_model::Element>& elements,
    int width = layout::default_width,
    bool frame = false);

diagram_model::Diagram layout_request(const diagram_model::DiagramRequest& request);

std::string join_lines(const diagram_model::Diagram& diagram);

// Widest line in cells.
int diagram_width(const diagram_model::Diagram& diagram);

} // namespace diagram_layout
