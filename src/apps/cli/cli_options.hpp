#pragma once

#include <diagram_model/types.hpp>
#include <optional>
#include <string>

namespace cli {

struct Options {
    std::string input_path;         // empty = stdin
    std::optional<int> width;
    bool frame = false;
    bool strict = false;
    bool demo = false;
    bool verbose = false;
    std::string sheet_anchor;       // non-empty = emit batch requests
    std::optional<int> sheet_id;
};

// Decimal integer that fits an int; anything else is std::nullopt.
std::optional<int> parse_int(const std::string& s);

// Returns std::nullopt (after logging why) on a usage error.
std::optional<Options> parse_args(int argc, const char* const argv[]);

// Command-line overrides win over the request's own settings.
void apply_overrides(const Options& opts, diagram_model::DiagramRequest& request);

} // namespace cli
