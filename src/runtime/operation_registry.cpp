#include <stencil/runtime/operation_registry.hpp>

#include <array>

namespace stencil::runtime {

namespace {

using parser::OpKind;

// Catalog order matches OpKind so spec() can index directly.
constexpr std::array<OperationSpec, 12> kOperations = {{
    {.name = "date.year",
     .kind = OpKind::DateYear,
     .min_args = 0,
     .max_args = 0,
     .usage = "date.year",
     .summary = "4-digit year"},
    {.name = "date.month",
     .kind = OpKind::DateMonth,
     .min_args = 0,
     .max_args = 0,
     .usage = "date.month",
     .summary = "2-digit month"},
    {.name = "date.year_month",
     .kind = OpKind::DateYearMonth,
     .min_args = 0,
     .max_args = 0,
     .usage = "date.year_month",
     .summary = "YYYY-MM"},
    {.name = "date.format",
     .kind = OpKind::DateFormat,
     .min_args = 1,
     .max_args = 1,
     .usage = "date.format:<spec>",
     .summary = "strftime-style formatting, e.g. date.format:%Y/%m"},
    {.name = "str.upper",
     .kind = OpKind::StrUpper,
     .min_args = 0,
     .max_args = 0,
     .usage = "str.upper",
     .summary = "uppercase"},
    {.name = "str.lower",
     .kind = OpKind::StrLower,
     .min_args = 0,
     .max_args = 0,
     .usage = "str.lower",
     .summary = "lowercase"},
    {.name = "str.title",
     .kind = OpKind::StrTitle,
     .min_args = 0,
     .max_args = 0,
     .usage = "str.title",
     .summary = "capitalize the first letter of each word"},
    {.name = "str.replace",
     .kind = OpKind::StrReplace,
     .min_args = 2,
     .max_args = 2,
     .usage = "str.replace:<old>:<new>",
     .summary = "replace every occurrence of <old>"},
    {.name = "str.slice",
     .kind = OpKind::StrSlice,
     .min_args = 2,
     .max_args = 2,
     .usage = "str.slice:<start>:<end>",
     .summary = "characters [start, end); empty end runs to the end"},
    {.name = "str.sanitize",
     .kind = OpKind::StrSanitize,
     .min_args = 0,
     .max_args = 0,
     .usage = "str.sanitize",
     .summary = "rewrite characters that are unsafe in file names"},
    {.name = "str.first_word",
     .kind = OpKind::StrFirstWord,
     .min_args = 0,
     .max_args = 0,
     .usage = "str.first_word",
     .summary = "first whitespace-delimited word"},
    {.name = "str.split_no_last",
     .kind = OpKind::StrSplitNoLast,
     .min_args = 0,
     .max_args = 0,
     .usage = "str.split_no_last",
     .summary = "N° followed by the text after the last N°"},
}};

static_assert(static_cast<std::size_t>(OpKind::StrSplitNoLast) + 1 == kOperations.size());

}  // namespace

OperationRegistry::OperationRegistry() {
    by_name_.reserve(kOperations.size());
    for (const auto& op : kOperations) {
        by_name_.emplace(op.name, &op);
    }
}

auto OperationRegistry::find(std::string_view name) const -> const OperationSpec* {
    if (auto it = by_name_.find(name); it != by_name_.end()) {
        return it->second;
    }
    return nullptr;
}

auto OperationRegistry::spec(parser::OpKind kind) const -> const OperationSpec& {
    return kOperations[static_cast<std::size_t>(kind)];
}

auto OperationRegistry::specs() const noexcept -> std::span<const OperationSpec> {
    return kOperations;
}

auto builtin_operations() -> const OperationRegistry& {
    static const OperationRegistry registry;
    return registry;
}

}  // namespace stencil::runtime
