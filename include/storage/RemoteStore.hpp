#pragma once

#include "util/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ts::storage {

struct RemoteEntry {
    std::string id;
    std::string name;
    bool isContainer{false};
    util::Timestamp modifiedAt{0};
    uint64_t size{0};
    std::optional<std::string> contentHash{};
    std::optional<std::string> parentId{};
};

struct RemotePage {
    std::vector<RemoteEntry> entries;
    std::optional<std::string> nextPageToken{};
};

struct UploadRequest {
    std::string name;
    std::vector<uint8_t> content;
    std::string mimeType;
    std::string parentId;
    std::optional<std::string> existingId{};      // set => update in place
    std::optional<util::Timestamp> modifiedAt{};  // preserved on the remote copy when supported
};

// Remote object store the sync core talks to. Every failure is thrown as a
// typed exception from sync/model/errors.hpp (AuthFailure for credential
// problems, TransientIOFailure otherwise).
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    virtual std::string findOrCreateContainer(const std::string& name,
                                              const std::optional<std::string>& parentId) = 0;

    virtual RemotePage listChildren(const std::string& containerId,
                                    const std::optional<std::string>& pageToken) = 0;

    virtual RemoteEntry getMetadata(const std::string& id) = 0;

    virtual std::vector<uint8_t> download(const std::string& id) = 0;

    virtual RemoteEntry upload(const UploadRequest& request) = 0;

    virtual void trash(const std::string& id) = 0;
};

}
