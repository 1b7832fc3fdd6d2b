#pragma once

#include <stencil/core/value.hpp>
#include <stencil/runtime/evaluator.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::runtime {

struct CsvRowOptions {
    char separator = ',';
    /// Integer and floating-point cells become numbers. Integers written with
    /// a leading zero stay strings so identifiers keep their padding.
    bool infer_numbers = true;
    /// Cells of columns whose upper-cased name contains "DATE" become Date or
    /// Timestamp values when they parse as dates.
    bool parse_date_columns = true;
};

/// Type one CSV cell according to its column name and the options.
/// An empty cell is an empty value.
[[nodiscard]] auto parse_cell(std::string_view column, std::string_view cell,
                              const CsvRowOptions& options = {}) -> Value;

/// Read a CSV file with a header row into one Row per record (RFC 4180 quoting).
[[nodiscard]] auto read_rows_csv(std::string_view path, const CsvRowOptions& options = {})
    -> std::expected<std::vector<Row>, std::string>;

}  // namespace stencil::runtime
