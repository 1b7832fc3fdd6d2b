#include <stencil/runtime/csv.hpp>

#include <fmt/core.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>

namespace stencil::runtime {

namespace {

auto csv_trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto is_date_column(std::string_view column) -> bool {
    std::string upper(column);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return upper.find("DATE") != std::string::npos;
}

auto has_leading_zero(std::string_view text) -> bool {
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        text.remove_prefix(1);
    }
    return text.size() > 1 && text.front() == '0' && text[1] != '.';
}

auto csv_try_int(std::string_view text, std::int64_t& out) -> bool {
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto csv_try_double(const std::string& text, double& out) -> bool {
    const auto first = static_cast<unsigned char>(text.front());
    if (std::isdigit(first) == 0 && first != '-' && first != '+' && first != '.') {
        return false;
    }
    char* end_ptr = nullptr;
    out = std::strtod(text.c_str(), &end_ptr);
    return end_ptr != text.c_str() && *end_ptr == '\0';
}

}  // namespace

auto parse_cell(std::string_view column, std::string_view cell, const CsvRowOptions& options)
    -> Value {
    auto text = csv_trim(cell);
    if (text.empty()) {
        return std::monostate{};
    }
    if (options.parse_date_columns && is_date_column(column)) {
        if (auto parsed = parse_date_text(text)) {
            return std::visit([](const auto& v) -> Value { return v; }, *parsed);
        }
    }
    if (options.infer_numbers && !has_leading_zero(text)) {
        std::int64_t iv{};
        if (csv_try_int(text, iv)) {
            return iv;
        }
        double dv{};
        if (csv_try_double(std::string(text), dv)) {
            return dv;
        }
    }
    return std::string(cell);
}

auto read_rows_csv(std::string_view path, const CsvRowOptions& options)
    -> std::expected<std::vector<Row>, std::string> {
    try {
        rapidcsv::Document doc(std::string(path),
                               rapidcsv::LabelParams(0, -1),  // row 0 = header, no row-index column
                               rapidcsv::SeparatorParams(options.separator));

        const auto columns = doc.GetColumnNames();
        const std::size_t row_count = doc.GetRowCount();
        std::vector<Row> rows;
        rows.reserve(row_count);
        for (std::size_t r = 0; r < row_count; ++r) {
            auto cells = doc.GetRow<std::string>(r);
            Row row;
            row.reserve(columns.size());
            for (std::size_t c = 0; c < columns.size(); ++c) {
                if (c < cells.size()) {
                    row.insert_or_assign(columns[c], parse_cell(columns[c], cells[c], options));
                } else {
                    row.insert_or_assign(columns[c], Value{});
                }
            }
            rows.push_back(std::move(row));
        }
        spdlog::debug("read {} rows x {} columns from {}", rows.size(), columns.size(), path);
        return rows;
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("cannot read '{}': {}", path, e.what()));
    }
}

}  // namespace stencil::runtime
