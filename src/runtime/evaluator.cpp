#include <stencil/parser/parser.hpp>
#include <stencil/runtime/evaluator.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <type_traits>

namespace stencil::runtime {

namespace {

auto to_eval_kind(ops::OpErrorKind kind) -> EvalErrorKind {
    switch (kind) {
        case ops::OpErrorKind::TypeMismatch:
            return EvalErrorKind::TypeMismatch;
        case ops::OpErrorKind::InvalidFormatSpec:
            return EvalErrorKind::InvalidFormatSpec;
        case ops::OpErrorKind::InvalidArgs:
            return EvalErrorKind::InvalidArgs;
    }
    return EvalErrorKind::InvalidArgs;
}

auto is_exempt(const EvaluateOptions& options, const std::string& field) -> bool {
    return std::find(options.sanitize_exempt.begin(), options.sanitize_exempt.end(), field) !=
           options.sanitize_exempt.end();
}

}  // namespace

auto error_kind_name(EvalErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case EvalErrorKind::TypeMismatch:
            return "TypeMismatch";
        case EvalErrorKind::InvalidFormatSpec:
            return "InvalidFormatSpec";
        case EvalErrorKind::InvalidArgs:
            return "InvalidArgs";
        case EvalErrorKind::MissingField:
            return "MissingField";
    }
    return "Unknown";
}

auto EvaluationError::format() const -> std::string {
    if (operation.empty()) {
        return fmt::format("offset {}: field '{}': {}: {}", offset, field, error_kind_name(kind),
                           message);
    }
    return fmt::format("offset {}: field '{}', operation '{}': {}: {}", offset, field, operation,
                       error_kind_name(kind), message);
}

auto evaluate_field(const parser::FieldExpr& field, const Row& row,
                    const EvaluateOptions& options) -> std::expected<Value, EvaluationError> {
    Value current;
    if (auto it = row.find(field.field); it != row.end()) {
        current = it->second;
    } else if (options.missing_fields == MissingFieldPolicy::Error) {
        return std::unexpected(EvaluationError{
            .kind = EvalErrorKind::MissingField,
            .field = field.field,
            .operation = {},
            .message = "field not found in row",
            .offset = field.offset,
        });
    }

    if (options.sanitize_strings && !is_exempt(options, field.field)) {
        if (auto* text = std::get_if<std::string>(&current)) {
            *text = ops::str_sanitize(*text);
        }
    }

    // A missing or empty cell enters the pipeline as the empty string.
    if (std::holds_alternative<std::monostate>(current)) {
        current = std::string{};
    }

    for (const auto& call : field.pipeline) {
        auto next = ops::apply_operation(call, current);
        if (!next) {
            return std::unexpected(EvaluationError{
                .kind = to_eval_kind(next.error().kind),
                .field = field.field,
                .operation = call.name,
                .message = std::move(next.error().message),
                .offset = field.offset,
            });
        }
        current = std::move(*next);
    }
    return current;
}

auto evaluate(const parser::Template& tmpl, const Row& row, const EvaluateOptions& options)
    -> EvalResult {
    std::string out;
    for (const auto& segment : tmpl.segments) {
        if (const auto* literal = std::get_if<parser::LiteralSegment>(&segment)) {
            out += literal->text;
            continue;
        }
        const auto& field = std::get<parser::FieldExpr>(segment);
        auto value = evaluate_field(field, row, options);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        out += to_display_string(*value);
    }
    return out;
}

auto render(std::string_view source, const Row& row, const EvaluateOptions& options)
    -> std::expected<std::string, std::string> {
    auto parsed = parser::parse(source);
    if (!parsed) {
        return std::unexpected(parsed.error().format());
    }
    auto rendered = evaluate(*parsed, row, options);
    if (!rendered) {
        return std::unexpected(rendered.error().format());
    }
    return std::move(*rendered);
}

}  // namespace stencil::runtime
