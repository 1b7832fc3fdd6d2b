#include <stencil/stencil.hpp>

#include <fmt/core.h>

auto main() -> int {
    // One matched spreadsheet record
    stencil::runtime::Row row;
    row.emplace("processed_folder", stencil::Value{std::string("/srv/invoices")});
    row.emplace("Supplier", stencil::Value{std::string("acme: north/east")});
    row.emplace("DATE FACTURE", stencil::Value{*stencil::make_date(2023, 7, 15)});

    fmt::print("=== Parse ===\n");
    auto tmpl = stencil::parser::parse(
        "{processed_folder}/{DATE FACTURE|date.year}/{Supplier|str.sanitize|str.upper} - "
        "{DATE FACTURE|date.format:%d.%m.%Y}.pdf");
    if (!tmpl) {
        fmt::print("parse error: {}\n", tmpl.error().format());
        return 1;
    }
    fmt::print("template has {} segments\n", tmpl->segments.size());

    fmt::print("\n=== Evaluate ===\n");
    auto rendered = stencil::runtime::evaluate(*tmpl, row);
    if (!rendered) {
        fmt::print("evaluation error: {}\n", rendered.error().format());
        return 1;
    }
    fmt::print("output: {}\n", *rendered);

    // Path segments are the caller's business
    for (const auto& segment : stencil::runtime::split_output_path(*rendered)) {
        fmt::print("  segment: '{}'\n", segment);
    }

    fmt::print("\n=== Errors ===\n");
    auto bad = stencil::parser::parse("{Supplier|str.shout}");
    if (!bad) {
        fmt::print("parse error: {}\n", bad.error().format());
    }
    auto mismatch = stencil::runtime::render("{Supplier|date.year}", row);
    if (!mismatch) {
        fmt::print("evaluation error: {}\n", mismatch.error());
    }

    return 0;
}
