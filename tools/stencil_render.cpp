#include <stencil/parser/parser.hpp>
#include <stencil/runtime/csv.hpp>
#include <stencil/runtime/evaluator.hpp>
#include <stencil/runtime/path.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>
#include <vector>

auto main(int argc, char** argv) -> int {
    CLI::App app{"stencil_render — render an output-path template for every CSV record"};
    app.set_version_flag("--version", "stencil_render 0.1.0");
    app.set_config("--config", "", "Read options from an INI or TOML file");

    std::string template_source;
    std::string csv_path;
    std::vector<std::string> constants;
    char separator = ',';
    bool sanitize = false;
    bool strict = false;
    bool keep_going = false;
    bool normalize = false;
    bool verbose = false;

    app.add_option("csv", csv_path, "CSV file with a header row")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-t,--template", template_source,
                   "Output template, e.g. '{processed_folder}/{Supplier|str.upper}.pdf'. "
                   "Defaults to the STENCIL_TEMPLATE environment variable.");
    app.add_option("--set", constants,
                   "Constant field added to every record, as field=value (repeatable)");
    app.add_option("--separator", separator, "CSV field separator (default: ',')");
    app.add_flag("--sanitize", sanitize,
                 "Sanitize string fields for file names (processed_folder is exempt)");
    app.add_flag("--strict", strict, "Fail on fields missing from a record");
    app.add_flag("--keep-going", keep_going, "Report failing records and continue");
    app.add_flag("--normalize", normalize,
                 "Normalize separators, '.' and '..' in the rendered path");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    if (template_source.empty()) {
        const char* env = std::getenv("STENCIL_TEMPLATE");
        if (env != nullptr) {
            template_source = env;
        }
    }
    if (template_source.empty()) {
        spdlog::error("no template given (use --template or STENCIL_TEMPLATE)");
        return 1;
    }

    // Reject a bad template before touching any data.
    auto tmpl = stencil::parser::parse(template_source);
    if (!tmpl) {
        spdlog::error("template: {}", tmpl.error().format());
        return 1;
    }

    stencil::runtime::Row extra;
    for (const auto& constant : constants) {
        auto eq = constant.find('=');
        if (eq == std::string::npos || eq == 0) {
            spdlog::error("--set expects field=value, got '{}'", constant);
            return 1;
        }
        extra.insert_or_assign(constant.substr(0, eq), stencil::Value{constant.substr(eq + 1)});
    }

    stencil::runtime::CsvRowOptions csv_options;
    csv_options.separator = separator;
    auto rows = stencil::runtime::read_rows_csv(csv_path, csv_options);
    if (!rows) {
        spdlog::error("{}", rows.error());
        return 1;
    }
    spdlog::debug("rendering {} records", rows->size());

    stencil::runtime::EvaluateOptions options;
    options.sanitize_strings = sanitize;
    if (strict) {
        options.missing_fields = stencil::runtime::MissingFieldPolicy::Error;
    }

    std::size_t failures = 0;
    for (std::size_t i = 0; i < rows->size(); ++i) {
        auto& row = (*rows)[i];
        for (const auto& [field, value] : extra) {
            row.insert_or_assign(field, value);
        }
        auto rendered = stencil::runtime::evaluate(*tmpl, row, options);
        if (!rendered) {
            spdlog::error("record {}: {}", i, rendered.error().format());
            ++failures;
            if (!keep_going) {
                return 1;
            }
            continue;
        }
        if (normalize) {
            fmt::print("{}\n", stencil::runtime::join_output_path(
                                   stencil::runtime::split_output_path(*rendered)));
        } else {
            fmt::print("{}\n", *rendered);
        }
    }

    if (failures > 0) {
        spdlog::error("{} of {} records failed", failures, rows->size());
        return 1;
    }
    return 0;
}
