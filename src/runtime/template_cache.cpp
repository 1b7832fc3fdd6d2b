#include <stencil/runtime/template_cache.hpp>

#include <spdlog/spdlog.h>

#include <mutex>

namespace stencil::runtime {

auto TemplateCache::get(std::string_view source)
    -> std::expected<TemplatePtr, parser::ParseError> {
    const std::string key(source);
    {
        std::shared_lock lock(mutex_);
        if (auto it = entries_.find(key); it != entries_.end()) {
            return it->second;
        }
    }

    // Parse outside the lock; a concurrent miss on the same source parses
    // twice and the first insertion wins.
    auto parsed = parser::parse(source);
    if (!parsed) {
        spdlog::debug("template cache: parse failed: {}", parsed.error().format());
        return std::unexpected(std::move(parsed.error()));
    }
    auto tmpl = std::make_shared<const parser::Template>(std::move(*parsed));

    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(key, std::move(tmpl));
    if (inserted) {
        spdlog::debug("template cache: parsed '{}' ({} segments)", key,
                      it->second->segments.size());
    }
    return it->second;
}

auto TemplateCache::contains(std::string_view source) const -> bool {
    std::shared_lock lock(mutex_);
    return entries_.find(std::string(source)) != entries_.end();
}

auto TemplateCache::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

void TemplateCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

}  // namespace stencil::runtime
