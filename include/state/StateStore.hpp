#pragma once

#include "util/timestamp.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ts::state {

struct SyncState {
    util::Timestamp watermark{0};               // 0 => never synced
    std::optional<std::string> remoteRootId{};  // cached id of the remote sync root
};

void to_json(nlohmann::json& j, const SyncState& s);
void from_json(const nlohmann::json& j, SyncState& s);

class StateStore {
public:
    virtual ~StateStore() = default;

    virtual SyncState load() = 0;
    virtual void save(const SyncState& state) = 0;

    // Exclusivity across processes sharing this state. false => held elsewhere.
    virtual bool tryLock() { return true; }
    virtual void unlock() {}
};

// Persists SyncState as a small JSON document. A missing file loads as the
// default state; writes go through a temp file and rename. tryLock() takes a
// non-blocking flock on "<path>.lock".
class JsonStateStore final : public StateStore {
public:
    explicit JsonStateStore(std::filesystem::path path);
    ~JsonStateStore() override;

    JsonStateStore(const JsonStateStore&) = delete;
    JsonStateStore& operator=(const JsonStateStore&) = delete;

    SyncState load() override;
    void save(const SyncState& state) override;

    bool tryLock() override;
    void unlock() override;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
    int lockFd_{-1};
};

}
