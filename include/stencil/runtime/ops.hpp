#pragma once

#include <stencil/core/value.hpp>
#include <stencil/parser/ast.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::ops {

enum class OpErrorKind : std::uint8_t {
    /// The value cannot be read as a date.
    TypeMismatch,
    InvalidFormatSpec,
    /// An argument is not usable, e.g. a non-integer slice bound.
    InvalidArgs,
};

struct OpError {
    OpErrorKind kind = OpErrorKind::TypeMismatch;
    std::string message;
};

using OpResult = std::expected<Value, OpError>;

[[nodiscard]] auto error_kind_name(OpErrorKind kind) noexcept -> std::string_view;

/// Apply one parsed operation to the value threaded through the pipeline.
[[nodiscard]] auto apply_operation(const parser::OperationCall& call, const Value& value)
    -> OpResult;

// ─── Date operations ──────────────────────────────────────────────────────────
//  Each coerces its input with to_civil_time() and returns a string.

[[nodiscard]] auto date_year(const Value& value) -> OpResult;
[[nodiscard]] auto date_month(const Value& value) -> OpResult;
[[nodiscard]] auto date_year_month(const Value& value) -> OpResult;
[[nodiscard]] auto date_format(const Value& value, std::string_view spec) -> OpResult;

// ─── String operations ────────────────────────────────────────────────────────
//  Case mapping covers ASCII and the Latin-1 letters of UTF-8; other bytes
//  pass through unchanged.

[[nodiscard]] auto str_upper(std::string_view text) -> std::string;
[[nodiscard]] auto str_lower(std::string_view text) -> std::string;
[[nodiscard]] auto str_title(std::string_view text) -> std::string;
[[nodiscard]] auto str_replace(std::string_view text, std::string_view from, std::string_view to)
    -> std::string;
/// Code points [start, end) clamped to the text; an empty `end` runs to the end.
[[nodiscard]] auto str_slice(std::string_view text, std::string_view start, std::string_view end)
    -> std::expected<std::string, OpError>;
[[nodiscard]] auto str_sanitize(std::string_view text) -> std::string;
[[nodiscard]] auto str_first_word(std::string_view text) -> std::string;
[[nodiscard]] auto str_split_no_last(std::string_view text) -> std::string;

}  // namespace stencil::ops
