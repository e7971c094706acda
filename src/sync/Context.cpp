#include "sync/Context.hpp"
#include "concurrency/ThreadPool.hpp"
#include "storage/RemoteStore.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::storage;
using namespace ts::util;

std::string ts::sync::to_string(const Category& c) {
    switch (c) {
    case Category::Conflicts: return "conflicts";
    case Category::Uploads: return "uploads";
    case Category::Downloads: return "downloads";
    case Category::DeleteLocal: return "local deletions";
    case Category::DeleteRemote: return "remote deletions";
    default: throw std::invalid_argument("Unknown category");
    }
}

std::string ts::sync::progressMessage(const Category c, const Action& action) {
    if (c == Category::Conflicts) return "Resolving conflict: " + action.path;

    switch (action.type) {
    case ActionType::Upload: return "Uploading: " + action.path;
    case ActionType::Download: return "Downloading: " + action.path;
    case ActionType::KeepBoth: return "Resolving conflict: " + action.path;
    case ActionType::DeleteLocal: return "Deleting local: " + action.path;
    case ActionType::DeleteRemote: return "Deleting remote: " + action.path;
    default: throw std::invalid_argument("Unknown action type");
    }
}

Context::Context(LocalStore& local,
                 RemoteStore& remote,
                 std::string remoteRootId,
                 const Index& remoteIndex,
                 const unsigned int maxConcurrency,
                 const std::size_t totalItems,
                 ProgressSink* sink,
                 CancelCheck cancelled)
    : local(local),
      remote(remote),
      remoteRootId_(std::move(remoteRootId)),
      pool_(std::make_unique<concurrency::ThreadPool>(maxConcurrency == 0 ? 1 : maxConcurrency)),
      sink_(sink),
      cancelled_(std::move(cancelled)),
      total_(totalItems) {
    containerIds_.emplace("", remoteRootId_);
    for (const auto& [path, entry] : remoteIndex)
        if (entry.isContainer && entry.remoteId) containerIds_.emplace(path, *entry.remoteId);
}

Context::~Context() {
    processFutures();
    pool_->stop();
}

std::string Context::ensureRemotePath(const std::string& path) {
    std::scoped_lock lock(containerMutex_);

    std::string prefix;
    std::string parentId = remoteRootId_;

    for (const auto& seg : splitSegments(normalizeRelPath(path))) {
        prefix = joinRelPath(prefix, seg);

        if (const auto it = containerIds_.find(prefix); it != containerIds_.end()) {
            parentId = it->second;
            continue;
        }

        parentId = remote.findOrCreateContainer(seg, parentId);
        containerIds_.emplace(prefix, parentId);
        log::Registry::sync()->debug("[Context] Created remote container {} ({})", prefix, parentId);
    }

    return parentId;
}

void Context::forgetRemoteContainer(const std::string& path) {
    std::scoped_lock lock(containerMutex_);
    containerIds_.erase(normalizeRelPath(path));
}

void Context::push(const std::shared_ptr<concurrency::PromisedTask>& task) {
    futures_.push_back(task->future());
    pool_->submit(task);
}

void Context::processFutures() {
    for (auto& f : futures_)
        if (!f.get()) log::Registry::sync()->debug("[Context] Task reported failure");
    futures_.clear();
}

bool Context::cancelled() const {
    return cancelled_ && cancelled_();
}

CategoryCounts& Context::counts(const Category c) {
    switch (c) {
    case Category::Conflicts: return tally_.conflicts;
    case Category::Uploads: return tally_.uploads;
    case Category::Downloads: return tally_.downloads;
    case Category::DeleteLocal: return tally_.deleteLocal;
    case Category::DeleteRemote: return tally_.deleteRemote;
    default: throw std::invalid_argument("Unknown category");
    }
}

void Context::record(std::unique_lock<std::mutex>& tallyLock, const std::string& path, const std::string& message) {
    const auto ticket = ++completed_;
    tallyLock.unlock();

    // Delivered in ticket order; the sink never runs under the tally lock.
    std::unique_lock deliver(sinkMutex_);
    sinkCv_.wait(deliver, [&] { return delivered_ + 1 == ticket; });

    if (sink_) {
        try {
            sink_->onProgress({
                .phase = Phase::Executing,
                .message = message,
                .completed = ticket,
                .total = total_,
                .currentPath = path,
            });
        } catch (const std::exception& e) {
            log::Registry::sync()->warn("[Context] Progress sink threw: {}", e.what());
        }
    }

    ++delivered_;
    deliver.unlock();
    sinkCv_.notify_all();
}

void Context::succeeded(const Category c, const std::string& path, const std::string& message) {
    std::unique_lock lock(tallyMutex_);
    ++counts(c).succeeded;
    record(lock, path, message);
}

void Context::failed(const Category c, const ActionType action, const std::string& path,
                     const std::string& message, const std::string& error) {
    std::unique_lock lock(tallyMutex_);
    ++counts(c).failed;
    tally_.failures.push_back({action, path, error});
    record(lock, path, message);
}

void Context::keptInPlace(const Category c, const std::string& path, const std::string& message) {
    std::unique_lock lock(tallyMutex_);
    ++counts(c).skipped;
    record(lock, path, message);
}

void Context::skipped(const Category c, const std::size_t count) {
    std::scoped_lock lock(tallyMutex_);
    counts(c).skipped += count;
}

void Context::planned(const Category c, const std::size_t count) {
    std::scoped_lock lock(tallyMutex_);
    counts(c).planned += count;
}

RunResult Context::tally() const {
    std::scoped_lock lock(tallyMutex_);
    return tally_;
}
