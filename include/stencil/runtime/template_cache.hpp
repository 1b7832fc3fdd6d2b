#pragma once

#include <stencil/parser/ast.hpp>
#include <stencil/parser/parser.hpp>

#include <robin_hood.h>

#include <expected>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace stencil::runtime {

using TemplatePtr = std::shared_ptr<const parser::Template>;

/// Parsed templates keyed by their source string.
///
/// Safe to share between threads: lookups take a shared lock and insertions an
/// exclusive one. Sources that fail to parse are not cached.
class TemplateCache {
   public:
    TemplateCache() = default;
    TemplateCache(const TemplateCache&) = delete;
    auto operator=(const TemplateCache&) -> TemplateCache& = delete;

    /// Return the parsed template for `source`, parsing it on first use.
    [[nodiscard]] auto get(std::string_view source) -> std::expected<TemplatePtr, parser::ParseError>;

    [[nodiscard]] auto contains(std::string_view source) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    void clear();

   private:
    mutable std::shared_mutex mutex_;
    robin_hood::unordered_node_map<std::string, TemplatePtr> entries_;
};

}  // namespace stencil::runtime
