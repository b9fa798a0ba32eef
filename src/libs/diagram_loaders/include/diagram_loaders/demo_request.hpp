#pragma once

#include <diagram_model/types.hpp>

namespace diagram_loaders {

// Built-in request exercising every element kind; used when no input file is given.
diagram_model::DiagramRequest generate_demo_request();

} // namespace diagram_loaders
