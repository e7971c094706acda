#include "state/StateStore.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#ifdef __linux__
  #include <fcntl.h>
  #include <sys/file.h>
  #include <unistd.h>
#endif

using namespace ts::state;
namespace fs = std::filesystem;

void ts::state::to_json(nlohmann::json& j, const SyncState& s) {
    j = {{"watermark", s.watermark}};
    if (s.remoteRootId) j["remote_root_id"] = *s.remoteRootId;
    else j["remote_root_id"] = nullptr;
}

void ts::state::from_json(const nlohmann::json& j, SyncState& s) {
    s.watermark = j.value("watermark", static_cast<util::Timestamp>(0));
    if (j.contains("remote_root_id") && j["remote_root_id"].is_string())
        s.remoteRootId = j["remote_root_id"].get<std::string>();
    else s.remoteRootId.reset();
}

JsonStateStore::JsonStateStore(fs::path path) : path_(std::move(path)) {}

JsonStateStore::~JsonStateStore() {
    unlock();
}

SyncState JsonStateStore::load() {
    std::scoped_lock lock(mutex_);

    if (!fs::exists(path_)) {
        log::Registry::state()->debug("[JsonStateStore] No state at {}, starting fresh", path_.string());
        return {};
    }

    std::ifstream in(path_);
    if (!in) throw std::runtime_error("Failed to open state file: " + path_.string());

    try {
        const auto j = nlohmann::json::parse(in);
        auto s = j.get<SyncState>();
        log::Registry::state()->debug("[JsonStateStore] Loaded watermark {} from {}",
                                      util::timestampToString(s.watermark), path_.string());
        return s;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Corrupt state file " + path_.string() + ": " + e.what());
    }
}

void JsonStateStore::save(const SyncState& state) {
    std::scoped_lock lock(mutex_);

    if (path_.has_parent_path()) fs::create_directories(path_.parent_path());

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open temp state file: " + tmp.string());
        out << nlohmann::json(state).dump(2) << '\n';
        if (!out) throw std::runtime_error("Failed to write state file: " + tmp.string());
    }

    fs::rename(tmp, path_);
    log::Registry::state()->debug("[JsonStateStore] Saved watermark {} to {}",
                                  util::timestampToString(state.watermark), path_.string());
}

bool JsonStateStore::tryLock() {
    std::scoped_lock lock(mutex_);
#ifdef __linux__
    if (lockFd_ >= 0) return false;

    if (path_.has_parent_path()) fs::create_directories(path_.parent_path());
    auto lockPath = path_;
    lockPath += ".lock";

    const int fd = ::open(lockPath.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) throw std::runtime_error("Failed to open lock file " + lockPath.string() + ": " + std::strerror(errno));

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            log::Registry::state()->info("[JsonStateStore] {} is held by another process", lockPath.string());
            return false;
        }
        throw std::runtime_error("Failed to lock " + lockPath.string() + ": " + std::strerror(err));
    }

    lockFd_ = fd;
#endif
    return true;
}

void JsonStateStore::unlock() {
    std::scoped_lock lock(mutex_);
#ifdef __linux__
    if (lockFd_ < 0) return;
    flock(lockFd_, LOCK_UN);
    ::close(lockFd_);
    lockFd_ = -1;
#endif
}
