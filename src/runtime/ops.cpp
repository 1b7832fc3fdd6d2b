#include <stencil/runtime/ops.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <optional>
#include <string>
#include <vector>

namespace stencil::ops {

namespace {

constexpr std::string_view kNumeroSign = "N\xC2\xB0";  // "N°"

enum class CaseMode : std::uint8_t {
    Upper,
    Lower,
    Title,
};

auto is_space(unsigned char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

auto is_ascii_alpha(unsigned char ch) -> bool {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

// Latin-1 letters encoded in UTF-8 share the lead byte 0xC3: upper case is
// 0x80..0x9E and lower case 0xA0..0xBE, except the signs × (0x97) and ÷ (0xB7).
// ß (0x9F) and ÿ (0xBF) are letters without a single-byte case partner.
auto is_latin1_letter(unsigned char trail) -> bool {
    return trail >= 0x80 && trail <= 0xBF && trail != 0x97 && trail != 0xB7;
}

auto map_latin1(unsigned char trail, bool to_upper) -> unsigned char {
    if (trail == 0x9F || trail == 0xBF) {
        return trail;
    }
    const bool is_upper = trail < 0xA0;
    if (to_upper && !is_upper) {
        return static_cast<unsigned char>(trail - 0x20);
    }
    if (!to_upper && is_upper) {
        return static_cast<unsigned char>(trail + 0x20);
    }
    return trail;
}

// Lead byte at `i` starts a Latin-1 symbol (U+0080..U+00BF, × and ÷) or a
// General Punctuation mark (U+2000..U+207F) such as ’ or –.
auto is_non_letter_lead(std::string_view text, std::size_t i) -> bool {
    const auto lead = static_cast<unsigned char>(text[i]);
    if (lead == 0xC2 || lead == 0xC3) {
        return true;
    }
    if (lead == 0xE2 && i + 1 < text.size()) {
        const auto next = static_cast<unsigned char>(text[i + 1]);
        return next == 0x80 || next == 0x81;
    }
    return false;
}

auto map_case(std::string_view text, CaseMode mode) -> std::string {
    std::string out;
    out.reserve(text.size());
    bool prev_letter = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto ch = static_cast<unsigned char>(text[i]);
        const bool to_upper = mode == CaseMode::Upper || (mode == CaseMode::Title && !prev_letter);
        if (ch < 0x80) {
            const bool letter = is_ascii_alpha(ch);
            if (letter) {
                const bool is_upper = ch <= 'Z';
                if (to_upper && !is_upper) {
                    out.push_back(static_cast<char>(ch - 0x20));
                } else if (!to_upper && is_upper) {
                    out.push_back(static_cast<char>(ch + 0x20));
                } else {
                    out.push_back(static_cast<char>(ch));
                }
            } else {
                out.push_back(static_cast<char>(ch));
            }
            prev_letter = letter;
            continue;
        }
        if (ch == 0xC3 && i + 1 < text.size() &&
            is_latin1_letter(static_cast<unsigned char>(text[i + 1]))) {
            out.push_back(static_cast<char>(ch));
            out.push_back(
                static_cast<char>(map_latin1(static_cast<unsigned char>(text[i + 1]), to_upper)));
            ++i;
            prev_letter = true;
            continue;
        }
        out.push_back(static_cast<char>(ch));
        // Other code points count as letters except the Latin-1 symbols and
        // General Punctuation. Continuation bytes keep the lead byte's state.
        if ((ch & 0xC0) == 0xC0) {
            prev_letter = !is_non_letter_lead(text, i);
        }
    }
    return out;
}

auto strip(std::string_view text, std::string_view chars) -> std::string_view {
    auto begin = text.find_first_not_of(chars);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(chars);
    return text.substr(begin, end - begin + 1);
}

constexpr std::string_view kWhitespace = " \t\n\r\v\f";

auto split_words(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> words;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        std::size_t start = i;
        while (i < text.size() && !is_space(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (i > start) {
            words.push_back(text.substr(start, i - start));
        }
    }
    return words;
}

auto parse_index(std::string_view text, std::string_view what)
    -> std::expected<std::size_t, OpError> {
    text = strip(text, kWhitespace);
    long long index = 0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, index);
    if (text.empty() || result.ec != std::errc() || result.ptr != end) {
        return std::unexpected(OpError{
            .kind = OpErrorKind::InvalidArgs,
            .message = fmt::format("slice {} '{}' is not an integer", what, text),
        });
    }
    if (index < 0) {
        return std::unexpected(OpError{
            .kind = OpErrorKind::InvalidArgs,
            .message = fmt::format("slice {} {} is negative; negative indices are not supported",
                                   what, index),
        });
    }
    return static_cast<std::size_t>(index);
}

// Empty cells pass through the date operations as the empty string.
auto is_blank(const Value& value) -> bool {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    const auto* text = std::get_if<std::string>(&value);
    return text != nullptr && strip(*text, kWhitespace).empty();
}

auto require_civil(const Value& value) -> std::expected<CivilTime, OpError> {
    auto civil = to_civil_time(value);
    if (!civil) {
        return std::unexpected(OpError{
            .kind = OpErrorKind::TypeMismatch,
            .message = fmt::format("cannot read {} value '{}' as a date",
                                   kind_name(kind_of(value)), to_display_string(value)),
        });
    }
    return *civil;
}

}  // namespace

auto error_kind_name(OpErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OpErrorKind::TypeMismatch:
            return "TypeMismatch";
        case OpErrorKind::InvalidFormatSpec:
            return "InvalidFormatSpec";
        case OpErrorKind::InvalidArgs:
            return "InvalidArgs";
    }
    return "Unknown";
}

// ─── Date operations ──────────────────────────────────────────────────────────

auto date_year(const Value& value) -> OpResult {
    if (is_blank(value)) {
        return Value{std::string{}};
    }
    auto civil = require_civil(value);
    if (!civil) {
        return std::unexpected(civil.error());
    }
    return Value{fmt::format("{:04}", civil->year)};
}

auto date_month(const Value& value) -> OpResult {
    if (is_blank(value)) {
        return Value{std::string{}};
    }
    auto civil = require_civil(value);
    if (!civil) {
        return std::unexpected(civil.error());
    }
    return Value{fmt::format("{:02}", civil->month)};
}

auto date_year_month(const Value& value) -> OpResult {
    if (is_blank(value)) {
        return Value{std::string{}};
    }
    auto civil = require_civil(value);
    if (!civil) {
        return std::unexpected(civil.error());
    }
    return Value{fmt::format("{:04}-{:02}", civil->year, civil->month)};
}

auto date_format(const Value& value, std::string_view spec) -> OpResult {
    if (is_blank(value)) {
        return Value{std::string{}};
    }
    auto civil = require_civil(value);
    if (!civil) {
        return std::unexpected(civil.error());
    }
    if (spec.empty()) {
        return std::unexpected(OpError{
            .kind = OpErrorKind::InvalidFormatSpec,
            .message = "empty date format",
        });
    }
    const std::tm tm = to_tm(*civil);
    try {
        return Value{fmt::format(fmt::runtime(fmt::format("{{:{}}}", spec)), tm)};
    } catch (const fmt::format_error& e) {
        return std::unexpected(OpError{
            .kind = OpErrorKind::InvalidFormatSpec,
            .message = fmt::format("invalid date format '{}': {}", spec, e.what()),
        });
    }
}

// ─── String operations ────────────────────────────────────────────────────────

auto str_upper(std::string_view text) -> std::string {
    return map_case(text, CaseMode::Upper);
}

auto str_lower(std::string_view text) -> std::string {
    return map_case(text, CaseMode::Lower);
}

auto str_title(std::string_view text) -> std::string {
    return map_case(text, CaseMode::Title);
}

auto str_replace(std::string_view text, std::string_view from, std::string_view to)
    -> std::string {
    if (from.empty()) {
        return std::string(text);
    }
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (true) {
        auto hit = text.find(from, pos);
        if (hit == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, hit - pos));
        out.append(to);
        pos = hit + from.size();
    }
    return out;
}

auto str_slice(std::string_view text, std::string_view start, std::string_view end)
    -> std::expected<std::string, OpError> {
    auto first = parse_index(start, "start");
    if (!first) {
        return std::unexpected(first.error());
    }
    std::optional<std::size_t> last;
    if (!strip(end, kWhitespace).empty()) {
        auto parsed = parse_index(end, "end");
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        last = *parsed;
    }

    // Byte offset of every code point start, plus the end of the text.
    std::vector<std::size_t> starts;
    starts.reserve(text.size() + 1);
    for (std::size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            starts.push_back(i);
        }
    }
    const std::size_t length = starts.size();
    starts.push_back(text.size());

    const std::size_t from = std::min(*first, length);
    const std::size_t to = std::min(last.value_or(length), length);
    if (from >= to) {
        return std::string{};
    }
    return std::string(text.substr(starts[from], starts[to] - starts[from]));
}

auto str_sanitize(std::string_view text) -> std::string {
    std::string replaced;
    replaced.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '/':
            case '\\':
                replaced.push_back('_');
                break;
            case ':':
            case '|':
                replaced.push_back('-');
                break;
            case '*':
                replaced.push_back('+');
                break;
            case '?':
            case '\0':
                break;
            case '"':
                replaced.push_back('\'');
                break;
            case '<':
                replaced.push_back('(');
                break;
            case '>':
                replaced.push_back(')');
                break;
            case '\n':
            case '\r':
            case '\t':
                replaced.push_back(' ');
                break;
            default:
                replaced.push_back(ch);
                break;
        }
    }
    std::string out;
    for (auto word : split_words(strip(replaced, ". "))) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out.append(word);
    }
    return out;
}

auto str_first_word(std::string_view text) -> std::string {
    auto words = split_words(text);
    return words.empty() ? std::string{} : std::string(words.front());
}

auto str_split_no_last(std::string_view text) -> std::string {
    auto pos = text.rfind(kNumeroSign);
    if (pos == std::string_view::npos) {
        return std::string(strip(text, kWhitespace));
    }
    return fmt::format("{}{}", kNumeroSign,
                       strip(text.substr(pos + kNumeroSign.size()), kWhitespace));
}

// ─── Dispatch ─────────────────────────────────────────────────────────────────

auto apply_operation(const parser::OperationCall& call, const Value& value) -> OpResult {
    using parser::OpKind;
    switch (call.kind) {
        case OpKind::DateYear:
            return date_year(value);
        case OpKind::DateMonth:
            return date_month(value);
        case OpKind::DateYearMonth:
            return date_year_month(value);
        case OpKind::DateFormat:
            return date_format(value, call.args.at(0));
        case OpKind::StrUpper:
            return Value{str_upper(to_display_string(value))};
        case OpKind::StrLower:
            return Value{str_lower(to_display_string(value))};
        case OpKind::StrTitle:
            return Value{str_title(to_display_string(value))};
        case OpKind::StrReplace:
            return Value{str_replace(to_display_string(value), call.args.at(0), call.args.at(1))};
        case OpKind::StrSlice: {
            auto sliced = str_slice(to_display_string(value), call.args.at(0), call.args.at(1));
            if (!sliced) {
                return std::unexpected(sliced.error());
            }
            return Value{std::move(*sliced)};
        }
        case OpKind::StrSanitize:
            return Value{str_sanitize(to_display_string(value))};
        case OpKind::StrFirstWord:
            return Value{str_first_word(to_display_string(value))};
        case OpKind::StrSplitNoLast:
            return Value{str_split_no_last(to_display_string(value))};
    }
    return std::unexpected(OpError{
        .kind = OpErrorKind::InvalidArgs,
        .message = fmt::format("operation '{}' is not applicable", call.name),
    });
}

}  // namespace stencil::ops
