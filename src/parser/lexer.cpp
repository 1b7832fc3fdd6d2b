#include <stencil/parser/lexer.hpp>

namespace stencil::parser {

auto tokenize(std::string_view source) -> std::vector<Token> {
    std::vector<Token> tokens;

    const auto add_token = [&](TokenKind kind, std::size_t start, std::size_t length) {
        tokens.push_back(Token{
            .kind = kind,
            .lexeme = source.substr(start, length),
            .offset = start,
        });
    };

    std::size_t i = 0;
    bool in_placeholder = false;

    while (i < source.size()) {
        if (!in_placeholder) {
            std::size_t brace = source.find('{', i);
            if (brace == std::string_view::npos) {
                brace = source.size();
            }
            if (brace > i) {
                add_token(TokenKind::Text, i, brace - i);
            }
            if (brace < source.size()) {
                add_token(TokenKind::LBrace, brace, 1);
                in_placeholder = true;
            }
            i = brace + 1;
            continue;
        }

        const char ch = source[i];
        switch (ch) {
            case '}':
                add_token(TokenKind::RBrace, i, 1);
                in_placeholder = false;
                ++i;
                continue;
            case '|':
                add_token(TokenKind::Pipe, i, 1);
                ++i;
                continue;
            case ':':
                add_token(TokenKind::Colon, i, 1);
                ++i;
                continue;
            case '{':
                add_token(TokenKind::Error, i, 1);
                ++i;
                continue;
            default:
                break;
        }

        std::size_t end = source.find_first_of("{}|:", i);
        if (end == std::string_view::npos) {
            end = source.size();
        }
        add_token(TokenKind::Text, i, end - i);
        i = end;
    }

    tokens.push_back(Token{.kind = TokenKind::Eof, .lexeme = {}, .offset = source.size()});
    return tokens;
}

}  // namespace stencil::parser
