#include <stencil/repl/repl.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"stencil — interactive output-path template playground"};

    bool verbose = false;
    bool strict = false;
    bool sanitize = false;
    std::string csv_path;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("--strict", strict, "Treat fields missing from the row as errors");
    app.add_flag("--sanitize", sanitize, "Sanitize string fields before rendering");
    app.add_option("--csv", csv_path, "Seed the row with the first record of a CSV file")
        ->check(CLI::ExistingFile);

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    stencil::repl::ReplConfig config;
    config.verbose = verbose;
    config.initial_csv = csv_path;
    config.eval_options.sanitize_strings = sanitize;
    if (strict) {
        config.eval_options.missing_fields = stencil::runtime::MissingFieldPolicy::Error;
    }

    stencil::repl::run(config);

    return 0;
}
