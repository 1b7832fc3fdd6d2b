#include <stencil/parser/parser.hpp>
#include <stencil/runtime/evaluator.hpp>
#include <stencil/runtime/template_cache.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace {

struct BenchTemplate {
    std::string name;
    std::string source;
};

auto make_rows(std::size_t count) -> std::vector<stencil::runtime::Row> {
    std::vector<stencil::runtime::Row> rows;
    rows.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        stencil::runtime::Row row;
        row.emplace("processed_folder", stencil::Value{std::string("/srv/archive")});
        row.emplace("Supplier", stencil::Value{fmt::format("acme supplies {}", i % 97)});
        row.emplace("Invoice", stencil::Value{fmt::format("INV N\xC2\xB0 {:05}", i)});
        row.emplace("Amount", stencil::Value{static_cast<double>(i) * 1.25});
        auto date = stencil::make_date(2020 + static_cast<int>(i % 5),
                                       static_cast<unsigned>(i % 12) + 1,
                                       static_cast<unsigned>(i % 28) + 1);
        row.emplace("DATE FACTURE", date ? stencil::Value{*date} : stencil::Value{});
        rows.push_back(std::move(row));
    }
    return rows;
}

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> double {
    return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(
               std::chrono::steady_clock::now() - start)
        .count();
}

auto run_benchmark(const BenchTemplate& bench, const std::vector<stencil::runtime::Row>& rows,
                   std::size_t warmup_iters, std::size_t iters, bool include_parse) -> int {
    stencil::runtime::TemplateCache cache;

    auto run_once = [&](std::size_t& bytes) -> int {
        stencil::runtime::TemplatePtr tmpl;
        if (include_parse) {
            auto parsed = stencil::parser::parse(bench.source);
            if (!parsed) {
                fmt::print("error: parse failed for {}: {}\n", bench.name, parsed.error().format());
                return 1;
            }
            tmpl = std::make_shared<const stencil::parser::Template>(std::move(*parsed));
        } else {
            auto cached = cache.get(bench.source);
            if (!cached) {
                fmt::print("error: parse failed for {}: {}\n", bench.name, cached.error().format());
                return 1;
            }
            tmpl = *cached;
        }
        for (const auto& row : rows) {
            auto rendered = stencil::runtime::evaluate(*tmpl, row);
            if (!rendered) {
                fmt::print("error: evaluate failed for {}: {}\n", bench.name,
                           rendered.error().format());
                return 1;
            }
            bytes += rendered->size();
        }
        return 0;
    };

    std::size_t bytes = 0;
    for (std::size_t i = 0; i < warmup_iters; ++i) {
        if (run_once(bytes) != 0) {
            return 1;
        }
    }

    bytes = 0;
    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iters; ++i) {
        if (run_once(bytes) != 0) {
            return 1;
        }
    }
    auto total_ms = elapsed_ms(start);
    auto avg_ms = total_ms / static_cast<double>(iters);
    auto ns_per_row = avg_ms * 1e6 / static_cast<double>(rows.empty() ? 1 : rows.size());

    fmt::print("bench {}: iters={}, total_ms={:.3f}, avg_ms={:.3f}, ns_per_row={:.1f}, bytes={}\n",
               bench.name, iters, total_ms, avg_ms, ns_per_row, bytes / iters);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"stencil benchmark harness"};

    std::size_t row_count = 100'000;
    std::size_t warmup_iters = 1;
    std::size_t iters = 5;
    bool include_parse = false;
    std::string custom_template;

    app.add_option("--rows", row_count, "Synthetic rows per iteration")
        ->check(CLI::PositiveNumber);
    app.add_option("--warmup", warmup_iters, "Warmup iterations")->check(CLI::NonNegativeNumber);
    app.add_option("--iters", iters, "Measured iterations")->check(CLI::PositiveNumber);
    app.add_flag("--include-parse", include_parse,
                 "Parse the template on every iteration instead of using the cache");
    app.add_option("--template", custom_template, "Benchmark a single custom template");

    CLI11_PARSE(app, argc, argv);

    const auto rows = make_rows(row_count);

    std::vector<BenchTemplate> templates = {
        {"literal_only", "/srv/archive/unsorted.pdf"},
        {"field_only", "{processed_folder}/{Supplier}.pdf"},
        {"case_ops", "{processed_folder}/{Supplier|str.upper} - {Supplier|str.title}.pdf"},
        {"date_ops",
         "{processed_folder}/{DATE FACTURE|date.year}/{DATE FACTURE|date.year_month}/"
         "{Invoice|str.split_no_last}.pdf"},
        {"date_format", "{DATE FACTURE|date.format:%Y/%m/%d}/{Amount}.pdf"},
        {"chained",
         "{Supplier|str.sanitize|str.replace: :_|str.slice:0:12|str.upper}/{Invoice|str.first_word}"},
    };
    if (!custom_template.empty()) {
        templates = {{"custom", custom_template}};
    }

    int status = 0;
    for (const auto& bench : templates) {
        status = run_benchmark(bench, rows, warmup_iters, iters, include_parse);
        if (status != 0) {
            break;
        }
    }
    return status;
}
