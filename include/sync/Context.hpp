#pragma once

#include "concurrency/Task.hpp"
#include "sync/model/Action.hpp"
#include "sync/model/Entry.hpp"
#include "sync/model/Progress.hpp"
#include "sync/model/RunResult.hpp"

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ts::storage {
class LocalStore;
class RemoteStore;
}

namespace ts::concurrency { class ThreadPool; }

namespace ts::sync {

enum class Category {
    Conflicts,
    Uploads,
    Downloads,
    DeleteLocal,
    DeleteRemote,
};

std::string to_string(const Category& c);

// "Uploading: notes/a.md", "Resolving conflict: notes/b.md", ...
std::string progressMessage(Category c, const model::Action& action);

// Shared state of one execution: stores, the remote container cache, the
// worker pool with its outstanding futures, and the running tally.
class Context {
public:
    using CancelCheck = std::function<bool()>;

    Context(storage::LocalStore& local,
            storage::RemoteStore& remote,
            std::string remoteRootId,
            const model::Index& remoteIndex,
            unsigned int maxConcurrency,
            std::size_t totalItems,
            model::ProgressSink* sink = nullptr,
            CancelCheck cancelled = {});

    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    storage::LocalStore& local;
    storage::RemoteStore& remote;

    // Looks up each segment of `path` and creates only the missing ones.
    // Serialized; returns the id of the deepest container.
    std::string ensureRemotePath(const std::string& path);

    void forgetRemoteContainer(const std::string& path);

    void push(const std::shared_ptr<concurrency::PromisedTask>& task);

    // Barrier: blocks until every pushed task has settled.
    void processFutures();

    [[nodiscard]] bool cancelled() const;

    void succeeded(Category c, const std::string& path, const std::string& message);
    void failed(Category c, model::ActionType action, const std::string& path,
                const std::string& message, const std::string& error);
    void keptInPlace(Category c, const std::string& path, const std::string& message);
    void skipped(Category c, std::size_t count);
    void planned(Category c, std::size_t count);

    [[nodiscard]] model::RunResult tally() const;

private:
    std::string remoteRootId_;
    std::unordered_map<std::string, std::string> containerIds_;
    std::mutex containerMutex_;

    std::unique_ptr<concurrency::ThreadPool> pool_;
    std::vector<std::future<concurrency::Outcome>> futures_;

    model::ProgressSink* sink_;
    CancelCheck cancelled_;

    mutable std::mutex tallyMutex_;
    model::RunResult tally_;
    std::size_t completed_{0};
    std::size_t total_;

    std::mutex sinkMutex_;
    std::condition_variable sinkCv_;
    std::size_t delivered_{0};

    model::CategoryCounts& counts(Category c);

    // Counts one finished item and reports it after releasing tallyLock.
    void record(std::unique_lock<std::mutex>& tallyLock, const std::string& path, const std::string& message);
};

}
