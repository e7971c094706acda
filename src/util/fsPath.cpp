#include "util/fsPath.hpp"

#include <algorithm>
#include <cctype>

namespace ts::util {

std::vector<std::string> splitSegments(const std::string_view path) {
    std::vector<std::string> parts;
    std::size_t start = 0;

    while (start <= path.size()) {
        const auto end = path.find('/', start);
        const auto len = (end == std::string_view::npos ? path.size() : end) - start;
        if (len > 0) parts.emplace_back(path.substr(start, len));
        if (end == std::string_view::npos) break;
        start = end + 1;
    }

    return parts;
}

std::string normalizeRelPath(const std::string_view path) {
    std::string out;
    out.reserve(path.size());

    for (const auto& seg : splitSegments(path)) {
        if (seg == ".") continue;
        if (!out.empty()) out += '/';
        out += seg;
    }

    return out;
}

std::string joinRelPath(const std::string_view parent, const std::string_view name) {
    if (parent.empty()) return std::string(name);
    std::string out(parent);
    out += '/';
    out += name;
    return out;
}

std::string parentOf(const std::string_view path) {
    const auto pos = path.rfind('/');
    if (pos == std::string_view::npos) return {};
    return std::string(path.substr(0, pos));
}

std::string lastSegment(const std::string_view path) {
    const auto pos = path.rfind('/');
    if (pos == std::string_view::npos) return std::string(path);
    return std::string(path.substr(pos + 1));
}

std::string extensionOf(const std::string_view path) {
    const auto name = lastSegment(path);
    const auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) return {};

    std::string ext = name.substr(dot);
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

std::size_t depthOf(const std::string_view path) {
    if (path.empty()) return 0;
    return static_cast<std::size_t>(std::ranges::count(path, '/')) + 1;
}

bool isSameOrDescendant(const std::string_view path, const std::string_view ancestor) {
    if (ancestor.empty()) return true;
    if (!path.starts_with(ancestor)) return false;
    return path.size() == ancestor.size() || path[ancestor.size()] == '/';
}

}
