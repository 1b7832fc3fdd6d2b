#pragma once

#include <stencil/runtime/csv.hpp>
#include <stencil/runtime/evaluator.hpp>
#include <stencil/runtime/template_cache.hpp>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace stencil::repl {

/// Configuration for the REPL session.
struct ReplConfig {
    bool verbose = false;
    std::string prompt = "stencil> ";
    runtime::EvaluateOptions eval_options;
    runtime::CsvRowOptions csv_options;
    /// CSV file whose first record seeds the current row, if set.
    std::string initial_csv;
};

/// State carried between REPL lines: the current row and the parsed templates.
struct Session {
    runtime::Row row;
    runtime::TemplateCache cache;
    runtime::EvaluateOptions eval_options;
    runtime::CsvRowOptions csv_options;
    /// The cache is emptied before a new template would push it past this size.
    std::size_t cache_limit = 256;
};

enum class LineStatus : std::uint8_t {
    Ok,
    Error,
    Quit,
};

/// Execute one input line: a `:command` or a template to render against the
/// current row. Output and error messages go to `out`.
auto execute_line(Session& session, std::string_view line, std::ostream& out) -> LineStatus;

/// Execute every line of `source` in a fresh session (useful for tests).
/// Returns false if any line reported an error.
[[nodiscard]] auto execute_script(std::string_view source, std::ostream& out) -> bool;

/// Run the interactive REPL loop on stdin/stdout.
void run(const ReplConfig& config);

}  // namespace stencil::repl
