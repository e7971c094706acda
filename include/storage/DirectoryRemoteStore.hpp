#pragma once

#include "storage/RemoteStore.hpp"

#include <filesystem>
#include <mutex>

namespace ts::storage {

// RemoteStore backed by a directory, typically a mounted share. Ids are paths
// relative to the store root; listings are name-ordered and paginated with an
// offset token.
class DirectoryRemoteStore final : public RemoteStore {
public:
    static constexpr const char* TRASH_DIR = ".trash";

    explicit DirectoryRemoteStore(std::filesystem::path root, std::size_t pageSize = 1000);
    ~DirectoryRemoteStore() override = default;

    std::string findOrCreateContainer(const std::string& name,
                                      const std::optional<std::string>& parentId) override;

    RemotePage listChildren(const std::string& containerId,
                            const std::optional<std::string>& pageToken) override;

    RemoteEntry getMetadata(const std::string& id) override;

    std::vector<uint8_t> download(const std::string& id) override;

    RemoteEntry upload(const UploadRequest& request) override;

    void trash(const std::string& id) override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::size_t pageSize_;
    std::mutex mutex_;

    [[nodiscard]] std::filesystem::path resolve(const std::string& id) const;
    [[nodiscard]] RemoteEntry describe(const std::string& id) const;
};

}
