#pragma once

#include "storage/LocalStore.hpp"

#include <filesystem>
#include <string>

namespace ts::storage {

// LocalStore over a directory. Deleted items are moved under <root>/.trash.
class LocalDiskStore final : public LocalStore {
public:
    static constexpr const char* TRASH_DIR = ".trash";

    explicit LocalDiskStore(std::filesystem::path root);
    ~LocalDiskStore() override = default;

    std::vector<LocalEntry> listAllEntries() override;
    std::optional<LocalStat> stat(const std::string& path) override;
    std::vector<uint8_t> readBytes(const std::string& path) override;
    void writeBytes(const std::string& path, const std::vector<uint8_t>& content,
                    const std::optional<util::Timestamp>& mtime = std::nullopt) override;
    void ensureContainer(const std::string& path) override;
    bool exists(const std::string& path) override;
    ContainerListing listContainer(const std::string& path) override;
    void removeEmptyContainer(const std::string& path) override;
    void moveToTrash(const std::string& path) override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;

    [[nodiscard]] std::filesystem::path absPath(const std::string& rel) const;
};

}
