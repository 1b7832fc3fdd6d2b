#include <stencil/core/value.hpp>

#include <fmt/format.h>

#include <cmath>
#include <string>
#include <type_traits>

namespace stencil {

auto kind_of(const Value& value) noexcept -> ValueKind {
    return std::visit(
        [](const auto& v) -> ValueKind {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return ValueKind::Empty;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return ValueKind::String;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return ValueKind::Int;
            } else if constexpr (std::is_same_v<T, double>) {
                return ValueKind::Double;
            } else if constexpr (std::is_same_v<T, Date>) {
                return ValueKind::Date;
            } else {
                return ValueKind::Timestamp;
            }
        },
        value);
}

auto kind_name(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::Empty:
            return "empty";
        case ValueKind::String:
            return "string";
        case ValueKind::Int:
            return "int";
        case ValueKind::Double:
            return "double";
        case ValueKind::Date:
            return "date";
        case ValueKind::Timestamp:
            return "timestamp";
    }
    return "unknown";
}

auto to_display_string(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else {
                return format_timestamp(v);
            }
        },
        value);
}

auto to_civil_time(const Value& value) -> std::optional<CivilTime> {
    if (const auto* date = std::get_if<Date>(&value)) {
        return to_civil(*date);
    }
    if (const auto* ts = std::get_if<Timestamp>(&value)) {
        return to_civil(*ts);
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        auto parsed = parse_date_text(*text);
        if (!parsed) {
            return std::nullopt;
        }
        return std::visit([](auto point) { return to_civil(point); }, *parsed);
    }
    return std::nullopt;
}

}  // namespace stencil
