// Command-line renderer: JSON diagram request in, text diagram (or spreadsheet batch requests) out.
#include "cli_options.hpp"
#include <diagram_layout/layout_engine.hpp>
#include <diagram_loaders/demo_request.hpp>
#include <diagram_loaders/json_loader.hpp>
#include <sheet_placement/a1_notation.hpp>
#include <sheet_placement/batch_requests.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>

namespace {

const int exit_usage = 1;
const int exit_load_failure = 2;

void print_usage(const char* program) {
    (void)fprintf(stderr,
        "usage: %s [--input FILE] [--width N] [--frame] [--strict]\n"
        "          [--sheet-requests A1 --sheet-id N] [--demo] [--verbose]\n"
        "Reads a diagram request (JSON) from FILE or stdin and prints the rendered diagram.\n"
        "With --sheet-requests, prints the spreadsheet batchUpdate body placing it at A1.\n",
        program);
}

} // namespace

int main(int argc, char* argv[])
{
    auto logger = spdlog::stderr_color_mt("sheet_diagram");
    logger->set_pattern("[%l] %v");
    logger->set_level(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    const std::optional<cli::Options> opts = cli::parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return exit_usage;
    }
    if (opts->verbose) logger->set_level(spdlog::level::debug);

    std::optional<diagram_model::DiagramRequest> request;
    std::string error;
    if (opts->demo) {
        request = diagram_loaders::generate_demo_request();
    } else if (!opts->input_path.empty()) {
        request = diagram_loaders::load_request_from_json_file(opts->input_path, &error, opts->strict);
    } else {
        request = diagram_loaders::load_request_from_json(std::cin, &error, opts->strict);
    }
    if (!request) {
        (void)fprintf(stderr, "error: %s\n", error.c_str());
        return exit_load_failure;
    }

    cli::apply_overrides(*opts, *request);

    const diagram_model::Diagram diagram = diagram_layout::layout_request(*request);
    spdlog::debug("rendered {} elements into {} lines", request->elements.size(), diagram.size());

    if (opts->sheet_anchor.empty()) {
        std::cout << diagram_layout::join_lines(diagram) << '\n';
        return 0;
    }

    try {
        const sheet_placement::A1Range anchor = sheet_placement::parse_a1(opts->sheet_anchor);
        const nlohmann::json body = sheet_placement::build_diagram_requests(diagram, *opts->sheet_id, anchor);
        std::cout << body.dump(2) << '\n';
    } catch (const sheet_placement::A1Error& e) {
        spdlog::error("{}", e.what());
        return exit_usage;
    }
    return 0;
}
