#pragma once

#include "util/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ts::storage {

struct LocalEntry {
    std::string path;   // relative to the store root
    bool isContainer{false};
};

struct LocalStat {
    util::Timestamp mtime{0};
    uint64_t size{0};
    bool isContainer{false};
};

struct ContainerListing {
    std::vector<std::string> files;
    std::vector<std::string> containers;

    [[nodiscard]] bool empty() const { return files.empty() && containers.empty(); }
};

// Local tree adapter. All paths are tree-relative with '/' separators.
class LocalStore {
public:
    virtual ~LocalStore() = default;

    virtual std::vector<LocalEntry> listAllEntries() = 0;

    // nullopt when the path vanished since listing
    virtual std::optional<LocalStat> stat(const std::string& path) = 0;

    virtual std::vector<uint8_t> readBytes(const std::string& path) = 0;

    virtual void writeBytes(const std::string& path, const std::vector<uint8_t>& content,
                            const std::optional<util::Timestamp>& mtime = std::nullopt) = 0;

    virtual void ensureContainer(const std::string& path) = 0;

    virtual bool exists(const std::string& path) = 0;

    virtual ContainerListing listContainer(const std::string& path) = 0;

    virtual void removeEmptyContainer(const std::string& path) = 0;

    virtual void moveToTrash(const std::string& path) = 0;
};

}
