#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ts::config { struct SyncConfig; }

namespace ts::sync {

// Decides which tree-relative paths take part in a sync. Applied identically
// to the local and remote indices.
class Filter {
public:
    struct Rules {
        std::vector<std::string> excludedFolders;     // segment-wise prefixes
        std::vector<std::string> excludedExtensions;  // with or without leading dot
        bool includeHidden{false};
    };

    Filter() = default;
    explicit Filter(Rules rules);

    static Filter fromConfig(const config::SyncConfig& cfg);

    [[nodiscard]] bool shouldExclude(std::string_view path) const;

    [[nodiscard]] const Rules& rules() const { return rules_; }

private:
    Rules rules_;
    std::vector<std::vector<std::string>> folderSegments_;
    std::vector<std::string> suffixes_;   // ".ext", lowercased

    [[nodiscard]] bool underExcludedFolder(const std::vector<std::string>& segments) const;
    [[nodiscard]] bool hasExcludedExtension(std::string_view name) const;
    [[nodiscard]] bool isHidden(const std::vector<std::string>& segments) const;
};

}
