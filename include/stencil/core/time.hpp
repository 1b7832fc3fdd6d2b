#pragma once

#include <compare>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace stencil {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Broken-down calendar fields of a Date or Timestamp.
struct CivilTime {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    unsigned weekday = 4;  // 0 = Sunday
    unsigned yearday = 0;  // 0-based
};

[[nodiscard]] auto make_date(int year, unsigned month, unsigned day) -> std::optional<Date>;
/// Empty when the instant falls outside the nanosecond range of Timestamp
/// (1677-09-22 00:00:00 to 2262-04-11 23:47:16).
[[nodiscard]] auto make_timestamp(Date date, unsigned hour, unsigned minute, unsigned second)
    -> std::optional<Timestamp>;

[[nodiscard]] auto to_civil(Date date) -> CivilTime;
[[nodiscard]] auto to_civil(Timestamp ts) -> CivilTime;
[[nodiscard]] auto to_tm(const CivilTime& civil) -> std::tm;

/// `YYYY-MM-DD`
[[nodiscard]] auto format_date(Date date) -> std::string;
/// `YYYY-MM-DD HH:MM:SS`
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

/// Recognize a date written in one of the common spreadsheet layouts:
/// `YYYY-MM-DD`, `YYYY/MM/DD`, `DD/MM/YYYY`, `DD-MM-YYYY`, `DD_MM_YYYY` or
/// `DD.MM.YYYY`, optionally followed by `[ T]HH:MM[:SS]`.
/// Returns a Date when no time of day is present, a Timestamp otherwise.
/// A date with a time of day outside the Timestamp range is not recognized.
[[nodiscard]] auto parse_date_text(std::string_view text)
    -> std::optional<std::variant<Date, Timestamp>>;

}  // namespace stencil

namespace std {

template <>
struct hash<stencil::Date> {
    auto operator()(const stencil::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<stencil::Timestamp> {
    auto operator()(const stencil::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

}  // namespace std
