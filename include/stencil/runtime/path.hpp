#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace stencil::runtime {

// ─── Output path helpers ──────────────────────────────────────────────────────
//  evaluate() never touches its output; callers that build file paths from a
//  rendered template use these.

/// Make one path component safe: str.sanitize, then "", "." and ".." become "_".
[[nodiscard]] auto sanitize_component(std::string_view component) -> std::string;

/// Split on '/' and '\\'. Empty and "." segments are dropped and ".." removes
/// the previous segment. A leading separator is kept as an empty first segment
/// so absolute paths survive a split/join round trip.
[[nodiscard]] auto split_output_path(std::string_view path) -> std::vector<std::string>;

/// Join segments with '/'.
[[nodiscard]] auto join_output_path(const std::vector<std::string>& segments) -> std::string;

}  // namespace stencil::runtime
