#pragma once

#include <stencil/core/time.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace stencil {

enum class ValueKind : std::uint8_t {
    Empty,
    String,
    Int,
    Double,
    Date,
    Timestamp,
};

/// A single raw field value. `std::monostate` is an empty cell.
using Value = std::variant<std::monostate, std::string, std::int64_t, double, Date, Timestamp>;

[[nodiscard]] auto kind_of(const Value& value) noexcept -> ValueKind;
[[nodiscard]] auto kind_name(ValueKind kind) noexcept -> std::string_view;

/// Display form used when a value is concatenated into output or fed to a
/// string operation. Dates render as `YYYY-MM-DD`, timestamps as
/// `YYYY-MM-DD HH:MM:SS`, doubles in shortest round-trip form.
[[nodiscard]] auto to_display_string(const Value& value) -> std::string;

/// Coerce a value to calendar fields for the date operations.
/// Strings are recognized with parse_date_text(); numbers never coerce.
[[nodiscard]] auto to_civil_time(const Value& value) -> std::optional<CivilTime>;

}  // namespace stencil
