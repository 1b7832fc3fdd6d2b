#pragma once

#include <stencil/parser/ast.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace stencil::parser {

enum class ParseErrorKind : std::uint8_t {
    /// Unterminated or nested '{', empty field name, empty operation.
    Syntax,
    UnknownOperation,
    ArityMismatch,
};

/// Template syntax error with the character offset of the offending token.
struct ParseError {
    ParseErrorKind kind = ParseErrorKind::Syntax;
    std::string message;
    std::size_t offset = 0;
    /// Operation name for UnknownOperation and ArityMismatch.
    std::string operation;
    std::size_t expected_min = 0;
    std::size_t expected_max = 0;
    std::size_t got = 0;

    [[nodiscard]] auto format() const -> std::string;
};

/// Result type for parse operations.
using ParseResult = std::expected<Template, ParseError>;

/// Parse a template source string.
///
/// Text outside `{...}` is literal. A placeholder is `{field|op|op:arg:arg}`;
/// every operation is resolved against builtin_operations() and its argument
/// count checked. There is no escape for literal braces or for ':' inside
/// arguments.
[[nodiscard]] auto parse(std::string_view source) -> ParseResult;

}  // namespace stencil::parser
