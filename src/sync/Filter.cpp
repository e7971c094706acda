#include "sync/Filter.hpp"
#include "config/Config.hpp"
#include "util/fsPath.hpp"

#include <algorithm>
#include <cctype>

using namespace ts::sync;
using namespace ts::util;

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return std::tolower(c); });
    return out;
}

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}

Filter::Filter(Rules rules) : rules_(std::move(rules)) {
    for (const auto& folder : rules_.excludedFolders) {
        auto segments = splitSegments(normalizeRelPath(folder));
        if (!segments.empty()) folderSegments_.push_back(std::move(segments));
    }

    for (const auto& ext : rules_.excludedExtensions) {
        if (ext.empty() || ext == ".") continue;
        suffixes_.push_back(ext.front() == '.' ? toLower(ext) : "." + toLower(ext));
    }
}

Filter Filter::fromConfig(const config::SyncConfig& cfg) {
    return Filter({
        .excludedFolders = cfg.excluded_folders,
        .excludedExtensions = cfg.excluded_extensions,
        .includeHidden = cfg.include_hidden_files,
    });
}

bool Filter::shouldExclude(const std::string_view path) const {
    const auto segments = splitSegments(normalizeRelPath(path));
    if (segments.empty()) return false;

    return underExcludedFolder(segments)
        || hasExcludedExtension(segments.back())
        || (!rules_.includeHidden && isHidden(segments));
}

bool Filter::underExcludedFolder(const std::vector<std::string>& segments) const {
    return std::ranges::any_of(folderSegments_, [&](const auto& prefix) {
        return prefix.size() <= segments.size()
            && std::equal(prefix.begin(), prefix.end(), segments.begin());
    });
}

bool Filter::hasExcludedExtension(const std::string_view name) const {
    if (suffixes_.empty()) return false;
    const auto lowered = toLower(name);
    return std::ranges::any_of(suffixes_, [&](const auto& suffix) { return endsWith(lowered, suffix); });
}

bool Filter::isHidden(const std::vector<std::string>& segments) const {
    return std::ranges::any_of(segments, [](const std::string& seg) {
        return seg != "." && !seg.empty() && seg.front() == '.';
    });
}
