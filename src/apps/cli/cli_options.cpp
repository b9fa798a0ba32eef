#include "cli_options.hpp"
#include <diagram_layout/layout_constants.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace cli {

std::optional<int> parse_int(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    const long value = std::strtol(s.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) return std::nullopt;
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
        return std::nullopt;
    return static_cast<int>(value);
}

std::optional<Options> parse_args(int argc, const char* const argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next_value = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                spdlog::error("{} needs a value", flag);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--input") {
            auto v = next_value("--input");
            if (!v) return std::nullopt;
            opts.input_path = *v;
        } else if (arg == "--width") {
            auto v = next_value("--width");
            if (!v) return std::nullopt;
            opts.width = parse_int(*v);
            if (!opts.width || *opts.width < diagram_layout::layout::min_width
                || *opts.width > diagram_layout::layout::max_width) {
                spdlog::error("--width must be an integer in [{}, {}]",
                    diagram_layout::layout::min_width, diagram_layout::layout::max_width);
                return std::nullopt;
            }
        } else if (arg == "--sheet-requests") {
            auto v = next_value("--sheet-requests");
            if (!v) return std::nullopt;
            opts.sheet_anchor = *v;
        } else if (arg == "--sheet-id") {
            auto v = next_value("--sheet-id");
            if (!v) return std::nullopt;
            opts.sheet_id = parse_int(*v);
            if (!opts.sheet_id || *opts.sheet_id < 0) {
                spdlog::error("--sheet-id must be a non-negative integer that fits in 32 bits");
                return std::nullopt;
            }
        } else if (arg == "--frame") {
            opts.frame = true;
        } else if (arg == "--strict") {
            opts.strict = true;
        } else if (arg == "--demo") {
            opts.demo = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else {
            spdlog::error("unknown argument '{}'", arg);
            return std::nullopt;
        }
    }
    if (!opts.sheet_anchor.empty() && !opts.sheet_id) {
        spdlog::error("--sheet-requests needs --sheet-id");
        return std::nullopt;
    }
    return opts;
}

void apply_overrides(const Options& opts, diagram_model::DiagramRequest& request) {
    if (opts.width) request.width = *opts.width;
    if (opts.frame) request.frame = true;
    if (opts.strict) request.strict = true;
}

} // namespace cli
