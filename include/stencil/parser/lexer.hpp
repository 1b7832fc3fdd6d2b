#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace stencil::parser {

/// Token types for the template lexer.
///
/// Outside a placeholder everything up to the next '{' is one Text token.
/// Inside a placeholder '|', ':' and '}' are punctuation and the runs
/// between them are Text.
enum class TokenKind : std::uint8_t {
    Text,

    // Delimiters
    LBrace,  // {
    RBrace,  // }
    Pipe,    // |
    Colon,   // :

    // Special
    Eof,
    Error,
};

/// A single token with its character offset in the template source.
struct Token {
    TokenKind kind = TokenKind::Error;
    std::string_view lexeme;
    std::size_t offset = 0;
};

/// Tokenize a template source string. The last token is always Eof; a '{'
/// inside a placeholder produces an Error token.
[[nodiscard]] auto tokenize(std::string_view source) -> std::vector<Token>;

}  // namespace stencil::parser
