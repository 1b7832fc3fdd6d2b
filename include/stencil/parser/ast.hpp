#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace stencil::parser {

/// Closed set of field operations. Names are resolved to a kind at parse
/// time, so evaluation never sees an unknown operation.
enum class OpKind : std::uint8_t {
    DateYear,
    DateMonth,
    DateYearMonth,
    DateFormat,
    StrUpper,
    StrLower,
    StrTitle,
    StrReplace,
    StrSlice,
    StrSanitize,
    StrFirstWord,
    StrSplitNoLast,
};

struct OperationCall {
    OpKind kind = OpKind::StrUpper;
    std::string name;
    std::vector<std::string> args;
    std::size_t offset = 0;

    auto operator==(const OperationCall&) const -> bool = default;
};

struct LiteralSegment {
    std::string text;

    auto operator==(const LiteralSegment&) const -> bool = default;
};

struct FieldExpr {
    std::string field;
    std::vector<OperationCall> pipeline;
    /// Offset of the opening '{' in the template source.
    std::size_t offset = 0;

    auto operator==(const FieldExpr&) const -> bool = default;
};

using Segment = std::variant<LiteralSegment, FieldExpr>;

struct Template {
    std::vector<Segment> segments;

    [[nodiscard]] auto empty() const noexcept -> bool { return segments.empty(); }
    auto operator==(const Template&) const -> bool = default;
};

}  // namespace stencil::parser
