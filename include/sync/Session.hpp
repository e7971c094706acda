#pragma once

#include "config/Config.hpp"
#include "sync/Filter.hpp"
#include "sync/model/Action.hpp"
#include "sync/model/Plan.hpp"
#include "sync/model/Progress.hpp"
#include "sync/model/RunResult.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ts::storage {
class LocalStore;
class RemoteStore;
}

namespace ts::state { class StateStore; }
namespace ts::auth { class CredentialProvider; }

namespace ts::sync {

// Result of a dry run: everything a run would do, nothing done.
struct Preview {
    model::RunResult result;
    model::SyncPlan plan;
    std::vector<model::Action> resolved;
};

// Orchestrates one end-to-end run and owns the watermark. At most one run is
// active at a time; a concurrent call returns Busy immediately.
class Session {
public:
    using Clock = std::function<util::Timestamp()>;

    struct Deps {
        std::shared_ptr<storage::LocalStore> local;
        std::shared_ptr<storage::RemoteStore> remote;
        std::shared_ptr<state::StateStore> state;
        std::shared_ptr<auth::CredentialProvider> credentials{};  // null => the remote needs none
        model::ProgressSink* progress{nullptr};
        Clock clock{};
    };

    Session(config::SyncConfig cfg, Deps deps);

    model::RunResult run();

    // Stops after resolving and returns the plan without executing it.
    Preview dryRun();

    // Cooperative; the active run stops at the next item or container boundary.
    void cancel();

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] model::Phase phase() const { return phase_.load(); }
    [[nodiscard]] const config::SyncConfig& config() const { return cfg_; }

private:
    config::SyncConfig cfg_;
    Deps deps_;
    Filter filter_;

    std::atomic<bool> running_{false};
    std::atomic<bool> cancelRequested_{false};
    std::atomic<model::Phase> phase_{model::Phase::Idle};

    struct Prepared {
        std::string rootId;
        util::Timestamp watermark{0};
        model::Index local, remote;
        model::SyncPlan plan;
        std::vector<model::Action> resolved;
    };

    void prepare(Prepared& p);
    void index(Prepared& p);
    void planAndResolve(Prepared& p, util::Timestamp startedAt);

    model::RunResult execute(Prepared& p, util::Timestamp startedAt);

    // Runs body under the exclusivity flag, mapping failures onto a RunResult.
    model::RunResult guarded(util::Timestamp startedAt, const std::function<model::RunResult()>& body);

    void enter(model::Phase phase, const std::string& message);
    [[nodiscard]] bool cancelled() const { return cancelRequested_.load(); }
    [[nodiscard]] util::Timestamp now() const;
};

}
