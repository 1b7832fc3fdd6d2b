#pragma once

#include <stencil/core/value.hpp>
#include <stencil/parser/ast.hpp>
#include <stencil/runtime/ops.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stencil::runtime {

/// Field values for one evaluation, keyed by column name.
using Row = std::unordered_map<std::string, Value>;

enum class EvalErrorKind : std::uint8_t {
    TypeMismatch,
    InvalidFormatSpec,
    InvalidArgs,
    /// Only raised under MissingFieldPolicy::Error.
    MissingField,
};

/// A failure while resolving one field expression.
struct EvaluationError {
    EvalErrorKind kind = EvalErrorKind::TypeMismatch;
    std::string field;
    /// Empty for MissingField.
    std::string operation;
    std::string message;
    /// Offset of the field expression's '{' in the template source.
    std::size_t offset = 0;

    [[nodiscard]] auto format() const -> std::string;
};

[[nodiscard]] auto error_kind_name(EvalErrorKind kind) noexcept -> std::string_view;

enum class MissingFieldPolicy : std::uint8_t {
    Empty,
    Error,
};

struct EvaluateOptions {
    MissingFieldPolicy missing_fields = MissingFieldPolicy::Empty;
    /// Run str.sanitize over string field values before their pipeline.
    bool sanitize_strings = false;
    /// Fields left untouched by sanitize_strings, typically the base folder.
    std::vector<std::string> sanitize_exempt = {"processed_folder"};
};

using EvalResult = std::expected<std::string, EvaluationError>;

/// Render a parsed template against one row.
[[nodiscard]] auto evaluate(const parser::Template& tmpl, const Row& row,
                            const EvaluateOptions& options = {}) -> EvalResult;

/// Resolve a single field expression to its final value, before display.
[[nodiscard]] auto evaluate_field(const parser::FieldExpr& field, const Row& row,
                                  const EvaluateOptions& options = {})
    -> std::expected<Value, EvaluationError>;

/// Parse and evaluate in one step; either error is flattened to its message.
[[nodiscard]] auto render(std::string_view source, const Row& row,
                          const EvaluateOptions& options = {})
    -> std::expected<std::string, std::string>;

}  // namespace stencil::runtime
