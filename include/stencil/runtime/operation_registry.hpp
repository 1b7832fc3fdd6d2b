#pragma once

#include <stencil/parser/ast.hpp>

#include <cstddef>
#include <span>
#include <string_view>
#include <unordered_map>

namespace stencil::runtime {

/// Static description of one field operation.
struct OperationSpec {
    std::string_view name;
    parser::OpKind kind = parser::OpKind::StrUpper;
    std::size_t min_args = 0;
    std::size_t max_args = 0;
    std::string_view usage;
    std::string_view summary;
};

/// Read-only catalog of the built-in operations.
///
/// The catalog is a constant table; there is no runtime registration. Use
/// builtin_operations() to obtain the process-wide instance.
class OperationRegistry {
   public:
    OperationRegistry();

    /// Look up an operation by name.
    [[nodiscard]] auto find(std::string_view name) const -> const OperationSpec*;

    /// Look up the spec of a resolved kind.
    [[nodiscard]] auto spec(parser::OpKind kind) const -> const OperationSpec&;

    [[nodiscard]] auto contains(std::string_view name) const -> bool {
        return by_name_.contains(name);
    }

    /// All operations in catalog order.
    [[nodiscard]] auto specs() const noexcept -> std::span<const OperationSpec>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return by_name_.size(); }

   private:
    std::unordered_map<std::string_view, const OperationSpec*> by_name_;
};

[[nodiscard]] auto builtin_operations() -> const OperationRegistry&;

}  // namespace stencil::runtime
