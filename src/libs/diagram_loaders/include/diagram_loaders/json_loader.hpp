#pragma once

#include <diagram_model/types.hpp>
#include <optional>
#include <istream>
#include <string>

namespace diagram_loaders {

// Decode a diagram request: { "elements": [...], "width": 60, "frame": false, "strict": false }.
// A bare array is accepted as the element list.
//
// On failure returns std::nullopt and, if `error` is non-null, stores a message
// naming the offending element. A malformed element rejects the whole request.
// Unknown element types decode to UnknownElement, unless `strict` (or the
// request's own "strict" field) is set, in which case they reject the request.
std::optional<diagram_model::DiagramRequest> load_request_from_json(std::istream& in,
    std::string* error = nullptr, bool strict = false);
std::optional<diagram_model::DiagramRequest> load_request_from_json_string(const std::string& text,
    std::string* error = nullptr, bool strict = false);
std::optional<diagram_model::DiagramRequest> load_request_from_json_file(const std::string& path,
    std::string* error = nullptr, bool strict = false);

} // namespace diagram_loaders
