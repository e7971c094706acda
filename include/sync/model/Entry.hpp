#pragma once

#include "util/timestamp.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ts::sync::model {

using util::Timestamp;

struct PathEntry {
    std::string path;   // normalized, '/'-separated, relative to the tree root
    std::string name;   // last path segment
    bool isContainer{false};
    std::optional<Timestamp> localModifiedAt{};
    std::optional<Timestamp> remoteModifiedAt{};
    uint64_t size{0};   // 0 for containers
    std::optional<std::string> remoteId{};
    std::optional<std::string> contentHash{};

    [[nodiscard]] Timestamp localStamp() const { return localModifiedAt.value_or(0); }
    [[nodiscard]] Timestamp remoteStamp() const { return remoteModifiedAt.value_or(0); }
};

// Ordered by path, so every container sorts before its descendants.
using Index = std::map<std::string, PathEntry>;

void to_json(nlohmann::json& j, const PathEntry& e);

}
