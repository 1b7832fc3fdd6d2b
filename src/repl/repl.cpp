#include <stencil/repl/repl.hpp>
#include <stencil/runtime/operation_registry.hpp>

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifdef STENCIL_HAS_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

namespace stencil::repl {

namespace {

#ifdef STENCIL_HAS_READLINE
constexpr std::array<std::string_view, 14> kColonCommands = {
    ":q",     ":quit",  ":exit",  ":ops",   ":row",      ":set",   ":date",
    ":unset", ":clear", ":load",  ":parse", ":sanitize", ":strict", ":help",
};

auto colon_command_generator(const char* text, int state) -> char* {
    static std::size_t index = 0;
    static std::string prefix;
    if (state == 0) {
        index = 0;
        prefix = text != nullptr ? text : "";
    }
    while (index < kColonCommands.size()) {
        const auto command = kColonCommands[index++];
        if (command.starts_with(prefix)) {
            return ::strdup(std::string(command).c_str());
        }
    }
    return nullptr;
}

auto repl_completion(const char* text, int start, int /*end*/) -> char** {
    if (start != 0 || text == nullptr || text[0] != ':') {
        return nullptr;
    }
    rl_attempted_completion_over = 1;
    return rl_completion_matches(text, colon_command_generator);
}

void configure_line_editing() {
    rl_attempted_completion_function = repl_completion;
}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    char* raw = ::readline(prompt.c_str());
    if (raw == nullptr) {
        return false;
    }
    out.assign(raw);
    if (!out.empty()) {
        ::add_history(raw);
    }
    std::free(raw);
    return true;
}
#else
void configure_line_editing() {}

auto read_repl_line(const std::string& prompt, std::string& out) -> bool {
    fmt::print("{}", prompt);
    return static_cast<bool>(std::getline(std::cin, out));
}
#endif

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

/// True when `line` is `command` alone or followed by whitespace.
auto starts_with_command(std::string_view line, std::string_view command) -> bool {
    if (!line.starts_with(command)) {
        return false;
    }
    if (line.size() == command.size()) {
        return true;
    }
    const char next = line[command.size()];
    return next == ' ' || next == '\t';
}

auto command_argument(std::string_view line, std::string_view command) -> std::string_view {
    return trim(line.substr(command.size()));
}

auto split_assignment(std::string_view arg)
    -> std::optional<std::pair<std::string_view, std::string_view>> {
    auto eq = arg.find('=');
    if (eq == std::string_view::npos) {
        return std::nullopt;
    }
    auto name = trim(arg.substr(0, eq));
    if (name.empty()) {
        return std::nullopt;
    }
    return std::pair{name, trim(arg.substr(eq + 1))};
}

auto parse_on_off(std::string_view arg, bool current) -> std::optional<bool> {
    if (arg.empty()) {
        return !current;
    }
    if (arg == "on") {
        return true;
    }
    if (arg == "off") {
        return false;
    }
    return std::nullopt;
}

/// `:load <file> [n]`; the file may be double-quoted to allow spaces.
struct LoadArgs {
    std::string path;
    std::size_t index = 0;
};

auto parse_load_args(std::string_view arg) -> std::optional<LoadArgs> {
    LoadArgs args;
    std::string_view rest;
    if (!arg.empty() && arg.front() == '"') {
        auto close = arg.find('"', 1);
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        args.path = std::string(arg.substr(1, close - 1));
        rest = trim(arg.substr(close + 1));
    } else {
        auto space = arg.find_first_of(" \t");
        args.path = std::string(arg.substr(0, space));
        rest = space == std::string_view::npos ? std::string_view{} : trim(arg.substr(space));
    }
    if (args.path.empty()) {
        return std::nullopt;
    }
    if (!rest.empty()) {
        const char* end = rest.data() + rest.size();
        auto result = std::from_chars(rest.data(), end, args.index);
        if (result.ec != std::errc() || result.ptr != end) {
            return std::nullopt;
        }
    }
    return args;
}

void print_help(std::ostream& out) {
    fmt::print(out,
               "Enter a template to render it against the current row, e.g.\n"
               "  {{DATE FACTURE|date.year}}/{{Supplier|str.upper}}.pdf\n"
               "Commands:\n"
               "  :set <field>=<text>      set a string field\n"
               "  :date <field>=<date>     set a date field (YYYY-MM-DD, DD/MM/YYYY, ...)\n"
               "  :unset <field>           remove a field\n"
               "  :clear                   remove every field\n"
               "  :load <file.csv> [n]     replace the row with record n of a CSV file\n"
               "  :row                     show the current row\n"
               "  :ops                     list the available operations\n"
               "  :parse <template>        show how a template is parsed\n"
               "  :strict [on|off]         treat missing fields as errors\n"
               "  :sanitize [on|off]       sanitize string fields before rendering\n"
               "  :q                       quit\n");
}

void print_ops(std::ostream& out) {
    for (const auto& op : runtime::builtin_operations().specs()) {
        fmt::print(out, "  {:<26} {}\n", op.usage, op.summary);
    }
}

void print_row(const runtime::Row& row, std::ostream& out) {
    if (row.empty()) {
        fmt::print(out, "(empty row)\n");
        return;
    }
    std::vector<const runtime::Row::value_type*> entries;
    entries.reserve(row.size());
    for (const auto& entry : row) {
        entries.push_back(&entry);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto* lhs, const auto* rhs) { return lhs->first < rhs->first; });
    for (const auto* entry : entries) {
        fmt::print(out, "  {} = {} ({})\n", entry->first, to_display_string(entry->second),
                   kind_name(kind_of(entry->second)));
    }
}

void print_template(const parser::Template& tmpl, std::ostream& out) {
    if (tmpl.empty()) {
        fmt::print(out, "(empty template)\n");
        return;
    }
    for (const auto& segment : tmpl.segments) {
        if (const auto* literal = std::get_if<parser::LiteralSegment>(&segment)) {
            fmt::print(out, "  literal \"{}\"\n", literal->text);
            continue;
        }
        const auto& field = std::get<parser::FieldExpr>(segment);
        std::string pipeline;
        for (const auto& call : field.pipeline) {
            pipeline += fmt::format(" | {}", call.name);
            for (const auto& arg : call.args) {
                pipeline += fmt::format(" \"{}\"", arg);
            }
        }
        fmt::print(out, "  field \"{}\"{}\n", field.field, pipeline);
    }
}

auto load_row(Session& session, std::string_view arg, std::ostream& out) -> LineStatus {
    auto args = parse_load_args(arg);
    if (!args) {
        fmt::print(out, "usage: :load <file.csv> [n]\n");
        return LineStatus::Error;
    }
    auto rows = runtime::read_rows_csv(args->path, session.csv_options);
    if (!rows) {
        fmt::print(out, "error: {}\n", rows.error());
        return LineStatus::Error;
    }
    if (args->index >= rows->size()) {
        fmt::print(out, "error: '{}' has {} records, no record {}\n", args->path, rows->size(),
                   args->index);
        return LineStatus::Error;
    }
    session.row = std::move((*rows)[args->index]);
    fmt::print(out, "loaded record {} of '{}' ({} fields)\n", args->index, args->path,
               session.row.size());
    return LineStatus::Ok;
}

auto cached_template(Session& session, std::string_view source)
    -> std::expected<runtime::TemplatePtr, parser::ParseError> {
    if (session.cache.size() >= session.cache_limit && !session.cache.contains(source)) {
        spdlog::debug("template cache reached {} entries, clearing", session.cache.size());
        session.cache.clear();
    }
    return session.cache.get(source);
}

auto render_line(Session& session, std::string_view line, std::ostream& out) -> LineStatus {
    auto tmpl = cached_template(session, line);
    if (!tmpl) {
        fmt::print(out, "error: {}\n", tmpl.error().format());
        return LineStatus::Error;
    }
    auto rendered = runtime::evaluate(**tmpl, session.row, session.eval_options);
    if (!rendered) {
        fmt::print(out, "error: {}\n", rendered.error().format());
        return LineStatus::Error;
    }
    fmt::print(out, "{}\n", *rendered);
    return LineStatus::Ok;
}

}  // namespace

auto execute_line(Session& session, std::string_view line, std::ostream& out) -> LineStatus {
    if (trim(line).empty()) {
        return LineStatus::Ok;
    }
    if (line.front() != ':') {
        return render_line(session, line, out);
    }
    line = trim(line);

    if (line == ":q" || line == ":quit" || line == ":exit") {
        return LineStatus::Quit;
    }
    if (line == ":help") {
        print_help(out);
        return LineStatus::Ok;
    }
    if (line == ":ops") {
        print_ops(out);
        return LineStatus::Ok;
    }
    if (line == ":row") {
        print_row(session.row, out);
        return LineStatus::Ok;
    }
    if (line == ":clear") {
        session.row.clear();
        return LineStatus::Ok;
    }
    if (starts_with_command(line, ":set")) {
        auto assignment = split_assignment(command_argument(line, ":set"));
        if (!assignment) {
            fmt::print(out, "usage: :set <field>=<text>\n");
            return LineStatus::Error;
        }
        session.row.insert_or_assign(std::string(assignment->first),
                                     Value{std::string(assignment->second)});
        return LineStatus::Ok;
    }
    if (starts_with_command(line, ":date")) {
        auto assignment = split_assignment(command_argument(line, ":date"));
        if (!assignment) {
            fmt::print(out, "usage: :date <field>=<date>\n");
            return LineStatus::Error;
        }
        auto parsed = parse_date_text(assignment->second);
        if (!parsed) {
            fmt::print(out, "error: '{}' is not a recognized date\n", assignment->second);
            return LineStatus::Error;
        }
        session.row.insert_or_assign(std::string(assignment->first),
                                     std::visit([](const auto& v) -> Value { return v; }, *parsed));
        return LineStatus::Ok;
    }
    if (starts_with_command(line, ":unset")) {
        auto name = command_argument(line, ":unset");
        if (name.empty()) {
            fmt::print(out, "usage: :unset <field>\n");
            return LineStatus::Error;
        }
        if (session.row.erase(std::string(name)) == 0) {
            fmt::print(out, "error: unknown field '{}'\n", name);
            return LineStatus::Error;
        }
        return LineStatus::Ok;
    }
    if (starts_with_command(line, ":load")) {
        return load_row(session, command_argument(line, ":load"), out);
    }
    if (starts_with_command(line, ":parse")) {
        auto parsed = cached_template(session, command_argument(line, ":parse"));
        if (!parsed) {
            fmt::print(out, "error: {}\n", parsed.error().format());
            return LineStatus::Error;
        }
        print_template(**parsed, out);
        return LineStatus::Ok;
    }
    if (starts_with_command(line, ":strict")) {
        const bool strict = session.eval_options.missing_fields == runtime::MissingFieldPolicy::Error;
        auto value = parse_on_off(command_argument(line, ":strict"), strict);
        if (!value) {
            fmt::print(out, "usage: :strict [on|off]\n");
            return LineStatus::Error;
        }
        session.eval_options.missing_fields =
            *value ? runtime::MissingFieldPolicy::Error : runtime::MissingFieldPolicy::Empty;
        fmt::print(out, "strict: {}\n", *value ? "on" : "off");
        return LineStatus::Ok;
    }
    if (starts_with_command(line, ":sanitize")) {
        auto value =
            parse_on_off(command_argument(line, ":sanitize"), session.eval_options.sanitize_strings);
        if (!value) {
            fmt::print(out, "usage: :sanitize [on|off]\n");
            return LineStatus::Error;
        }
        session.eval_options.sanitize_strings = *value;
        fmt::print(out, "sanitize: {}\n", *value ? "on" : "off");
        return LineStatus::Ok;
    }

    fmt::print(out, "error: unknown command '{}' (try :help)\n", line);
    return LineStatus::Error;
}

auto execute_script(std::string_view source, std::ostream& out) -> bool {
    Session session;
    bool ok = true;
    std::istringstream input{std::string(source)};
    std::string line;
    while (std::getline(input, line)) {
        auto status = execute_line(session, line, out);
        if (status == LineStatus::Quit) {
            break;
        }
        ok = ok && status == LineStatus::Ok;
    }
    return ok;
}

void run(const ReplConfig& config) {
    if (config.verbose) {
        spdlog::info("stencil REPL started (verbose={})", config.verbose);
    }

    Session session;
    session.eval_options = config.eval_options;
    session.csv_options = config.csv_options;
    if (!config.initial_csv.empty()) {
        if (load_row(session, fmt::format("\"{}\"", config.initial_csv), std::cout) !=
            LineStatus::Ok) {
            spdlog::warn("starting with an empty row");
        }
    }
    configure_line_editing();

    std::string line;
    while (true) {
        if (!read_repl_line(config.prompt, line)) {
            fmt::print("\n");
            break;
        }
        if (execute_line(session, line, std::cout) == LineStatus::Quit) {
            break;
        }
    }

    spdlog::info("stencil REPL exiting");
}

}  // namespace stencil::repl
