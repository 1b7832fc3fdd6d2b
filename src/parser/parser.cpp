#include <stencil/parser/lexer.hpp>
#include <stencil/parser/parser.hpp>
#include <stencil/runtime/operation_registry.hpp>

#include <fmt/core.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stencil::parser {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto describe_arity(std::size_t min_args, std::size_t max_args) -> std::string {
    if (min_args == max_args) {
        return fmt::format("{} argument{}", min_args, min_args == 1 ? "" : "s");
    }
    return fmt::format("{} to {} arguments", min_args, max_args);
}

class Parser {
   public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    auto parse_template() -> std::expected<Template, ParseError> {
        Template tmpl;
        while (!is_at_end()) {
            if (match(TokenKind::LBrace)) {
                auto field = parse_field_expr();
                if (!field.has_value()) {
                    return std::unexpected(error_);
                }
                tmpl.segments.emplace_back(std::move(*field));
                continue;
            }
            if (match(TokenKind::Text)) {
                tmpl.segments.emplace_back(LiteralSegment{.text = std::string(previous().lexeme)});
                continue;
            }
            return std::unexpected(
                make_syntax_error(peek().offset, fmt::format("unexpected '{}'", peek().lexeme)));
        }
        return tmpl;
    }

   private:
    /// Parse the body of `{field|op|...}`; the '{' has been consumed.
    auto parse_field_expr() -> std::optional<FieldExpr> {
        const Token& open = previous();
        std::string raw_name;
        while (check(TokenKind::Text) || check(TokenKind::Colon)) {
            raw_name += advance().lexeme;
        }
        if (!check_placeholder_continues(open)) {
            return std::nullopt;
        }
        auto name = trim(raw_name);
        if (name.empty()) {
            error_ = make_syntax_error(open.offset, "empty field name");
            return std::nullopt;
        }

        FieldExpr field{.field = std::string(name), .pipeline = {}, .offset = open.offset};
        while (match(TokenKind::Pipe)) {
            auto call = parse_operation_call(previous().offset + 1);
            if (!call.has_value()) {
                return std::nullopt;
            }
            field.pipeline.push_back(std::move(*call));
        }
        if (!check_placeholder_continues(open)) {
            return std::nullopt;
        }
        if (!match(TokenKind::RBrace)) {
            error_ = make_syntax_error(peek().offset, "expected '}' to close field expression");
            return std::nullopt;
        }
        return field;
    }

    /// Parse `opname[:arg[:arg...]]` up to the next '|' or '}'.
    auto parse_operation_call(std::size_t offset) -> std::optional<OperationCall> {
        std::vector<std::string> parts(1);
        while (check(TokenKind::Text) || check(TokenKind::Colon)) {
            const Token& token = advance();
            if (token.kind == TokenKind::Colon) {
                parts.emplace_back();
            } else {
                parts.back() += token.lexeme;
            }
        }
        auto name = trim(parts.front());
        if (name.empty()) {
            error_ = make_syntax_error(offset, "empty operation");
            return std::nullopt;
        }

        const auto* spec = runtime::builtin_operations().find(name);
        if (spec == nullptr) {
            error_ = ParseError{
                .kind = ParseErrorKind::UnknownOperation,
                .message = fmt::format("unknown operation '{}'", name),
                .offset = offset,
                .operation = std::string(name),
            };
            return std::nullopt;
        }

        std::vector<std::string> args(std::make_move_iterator(parts.begin() + 1),
                                      std::make_move_iterator(parts.end()));
        if (args.size() < spec->min_args || args.size() > spec->max_args) {
            error_ = ParseError{
                .kind = ParseErrorKind::ArityMismatch,
                .message = fmt::format("operation '{}' expects {}, got {}", spec->name,
                                       describe_arity(spec->min_args, spec->max_args),
                                       args.size()),
                .offset = offset,
                .operation = std::string(spec->name),
                .expected_min = spec->min_args,
                .expected_max = spec->max_args,
                .got = args.size(),
            };
            return std::nullopt;
        }

        return OperationCall{
            .kind = spec->kind,
            .name = std::string(spec->name),
            .args = std::move(args),
            .offset = offset,
        };
    }

    /// Reports end of input and nested braces inside a placeholder.
    auto check_placeholder_continues(const Token& open) -> bool {
        if (check(TokenKind::Eof)) {
            error_ = make_syntax_error(open.offset, "unterminated '{'");
            return false;
        }
        if (check(TokenKind::Error)) {
            error_ = make_syntax_error(peek().offset, "nested '{' inside field expression");
            return false;
        }
        return true;
    }

    [[nodiscard]] auto is_at_end() const -> bool { return peek().kind == TokenKind::Eof; }

    [[nodiscard]] auto peek() const -> const Token& { return tokens_[current_]; }

    [[nodiscard]] auto previous() const -> const Token& { return tokens_[current_ - 1]; }

    [[nodiscard]] auto check(TokenKind kind) const -> bool { return peek().kind == kind; }

    auto advance() -> const Token& {
        if (!is_at_end()) {
            ++current_;
        }
        return previous();
    }

    auto match(TokenKind kind) -> bool {
        if (!check(kind)) {
            return false;
        }
        advance();
        return true;
    }

    static auto make_syntax_error(std::size_t offset, std::string message) -> ParseError {
        return ParseError{
            .kind = ParseErrorKind::Syntax,
            .message = std::move(message),
            .offset = offset,
        };
    }

    std::vector<Token> tokens_;
    std::size_t current_ = 0;
    ParseError error_{};
};

}  // namespace

auto ParseError::format() const -> std::string {
    return fmt::format("offset {}: {}", offset, message);
}

auto parse(std::string_view source) -> ParseResult {
    Parser parser(tokenize(source));
    return parser.parse_template();
}

}  // namespace stencil::parser
