#include <stencil/runtime/ops.hpp>
#include <stencil/runtime/path.hpp>

namespace stencil::runtime {

auto sanitize_component(std::string_view component) -> std::string {
    auto clean = ops::str_sanitize(component);
    if (clean.empty() || clean == "." || clean == "..") {
        return "_";
    }
    return clean;
}

auto split_output_path(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> segments;
    const bool absolute = !path.empty() && (path.front() == '/' || path.front() == '\\');
    if (absolute) {
        segments.emplace_back();
    }
    const std::size_t root = segments.size();

    std::size_t pos = 0;
    while (pos <= path.size()) {
        auto sep = path.find_first_of("/\\", pos);
        if (sep == std::string_view::npos) {
            sep = path.size();
        }
        auto part = path.substr(pos, sep - pos);
        pos = sep + 1;
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (segments.size() > root && segments.back() != "..") {
                segments.pop_back();
            } else if (!absolute) {
                segments.emplace_back(part);
            }
            continue;
        }
        segments.emplace_back(part);
    }
    return segments;
}

auto join_output_path(const std::vector<std::string>& segments) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            out.push_back('/');
        }
        out += segments[i];
    }
    if (segments.size() == 1 && segments.front().empty()) {
        out = "/";
    }
    return out;
}

}  // namespace stencil::runtime
