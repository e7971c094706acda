#include "sync/Session.hpp"
#include "sync/Context.hpp"
#include "sync/Executor.hpp"
#include "sync/Indexer.hpp"
#include "sync/Planner.hpp"
#include "sync/Resolver.hpp"
#include "sync/model/errors.hpp"
#include "storage/LocalStore.hpp"
#include "storage/RemoteStore.hpp"
#include "state/StateStore.hpp"
#include "auth/CredentialProvider.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::util;

namespace {

// Releases the state lock and the exclusivity flag however the run ends.
struct RunGuard {
    std::atomic<bool>& flag;
    std::atomic<Phase>& phase;
    ts::state::StateStore& state;
    ~RunGuard() {
        state.unlock();
        phase.store(Phase::Idle);
        flag.store(false);
    }
};

}

Session::Session(config::SyncConfig cfg, Deps deps)
    : cfg_(std::move(cfg)), deps_(std::move(deps)), filter_(Filter::fromConfig(cfg_)) {
    if (!deps_.local || !deps_.remote || !deps_.state)
        throw std::invalid_argument("Session requires a local store, a remote store and a state store");
    if (!deps_.clock) deps_.clock = nowMillis;
}

Timestamp Session::now() const { return deps_.clock(); }

void Session::cancel() {
    if (!running_.load()) return;
    cancelRequested_.store(true);
    log::Registry::sync()->info("[Session] Cancellation requested");
}

void Session::enter(const Phase phase, const std::string& message) {
    phase_.store(phase);
    log::Registry::sync()->debug("[Session] {}: {}", to_string(phase), message);
    if (deps_.progress) deps_.progress->onProgress({.phase = phase, .message = message});
}

RunResult Session::run() {
    const auto startedAt = now();
    Prepared p;

    auto result = guarded(startedAt, [&] {
        prepare(p);
        index(p);
        planAndResolve(p, startedAt);
        return execute(p, startedAt);
    });

    if (result.status == RunResult::Status::Aborted || result.status == RunResult::Status::Cancelled)
        result.watermarkBefore = result.watermarkAfter = p.watermark;

    return result;
}

Preview Session::dryRun() {
    const auto startedAt = now();
    Preview preview;

    preview.result = guarded(startedAt, [&] {
        Prepared p;
        prepare(p);
        index(p);
        planAndResolve(p, startedAt);

        RunResult r;
        r.watermarkBefore = r.watermarkAfter = p.watermark;
        r.conflicts.planned = p.plan.conflicts.size();
        r.uploads.planned = Executor::fileCount(p.plan.uploads);
        r.downloads.planned = Executor::fileCount(p.plan.downloads);
        r.deleteLocal.planned = p.plan.deleteLocal.size();
        r.deleteRemote.planned = p.plan.deleteRemote.size();

        preview.plan = std::move(p.plan);
        preview.resolved = std::move(p.resolved);
        return r;
    });

    return preview;
}

RunResult Session::guarded(const Timestamp startedAt, const std::function<RunResult()>& body) {
    if (bool expected = false; !running_.compare_exchange_strong(expected, true)) {
        log::Registry::sync()->info("[Session] Run requested while another is active, rejecting");
        return RunResult::busy();
    }

    // Another process may be syncing against the same state.
    bool locked = false;
    try {
        locked = deps_.state->tryLock();
    } catch (const std::exception& e) {
        running_.store(false);
        log::Registry::sync()->error("[Session] Could not lock sync state: {}", e.what());
        auto r = RunResult::aborted(RunResult::AbortKind::Internal, e.what());
        r.startedAt = r.finishedAt = startedAt;
        return r;
    }

    if (!locked) {
        running_.store(false);
        log::Registry::sync()->info("[Session] Sync state is locked by another process, rejecting");
        return RunResult::busy();
    }

    cancelRequested_.store(false);
    RunGuard guard{running_, phase_, *deps_.state};

    RunResult result;
    try {
        result = body();
    } catch (const AuthFailure& e) {
        log::Registry::sync()->error("[Session] Authentication failed: {}", e.what());
        result = RunResult::aborted(RunResult::AbortKind::Auth, e.what());
    } catch (const Cancelled& e) {
        log::Registry::sync()->info("[Session] {}", e.what());
        result.status = RunResult::Status::Cancelled;
        result.abortReason = e.what();
    } catch (const SyncError& e) {
        log::Registry::sync()->error("[Session] Run aborted: {}", e.what());
        result = RunResult::aborted(RunResult::AbortKind::Structural, e.what());
    } catch (const std::exception& e) {
        log::Registry::sync()->error("[Session] Run aborted by internal error: {}", e.what());
        result = RunResult::aborted(RunResult::AbortKind::Internal, e.what());
    }

    result.startedAt = startedAt;
    result.finishedAt = now();

    enter(Phase::Idle, "Sync " + to_string(result.status));
    return result;
}

void Session::prepare(Prepared& p) {
    enter(Phase::Preparing, "Checking credentials");

    auto state = deps_.state->load();
    p.watermark = state.watermark;

    if (deps_.credentials && !deps_.credentials->validAccessToken())
        throw AuthFailure("No valid access token for the remote store");

    enter(Phase::Preparing, "Ensuring remote folder " + cfg_.remote_folder_name);
    p.rootId = deps_.remote->findOrCreateContainer(cfg_.remote_folder_name, std::nullopt);

    if (state.remoteRootId != p.rootId) {
        state.remoteRootId = p.rootId;
        deps_.state->save(state);
    }
}

void Session::index(Prepared& p) {
    enter(Phase::Indexing, "Indexing local and remote trees");

    const auto cancelCheck = [this] { return cancelled(); };

    auto localFuture = std::async(std::launch::async, [&] {
        return Indexer::buildLocal(*deps_.local, filter_, cancelCheck);
    });
    auto remoteFuture = std::async(std::launch::async, [&] {
        return Indexer::buildRemote(*deps_.remote, p.rootId, filter_, cfg_.max_pages_per_container, cancelCheck);
    });

    // Remote errors carry auth problems, so they are surfaced first.
    p.remote = remoteFuture.get();
    p.local = localFuture.get();

    log::Registry::sync()->info("[Session] Indexed {} local and {} remote entries", p.local.size(), p.remote.size());
}

void Session::planAndResolve(Prepared& p, const Timestamp startedAt) {
    if (cancelled()) throw Cancelled("Sync cancelled before planning");

    enter(Phase::Planning, "Computing changes since " + timestampToString(p.watermark));
    p.plan = Planner::build(p.local, p.remote, p.watermark);

    enter(Phase::Resolving, std::to_string(p.plan.conflicts.size()) + " conflicts under " +
                            to_string(cfg_.conflict_policy));
    const Resolver resolver(cfg_.conflict_policy, [startedAt] { return startedAt; });
    p.resolved = resolver.resolveAll(p.plan.conflicts);
}

RunResult Session::execute(Prepared& p, const Timestamp startedAt) {
    if (cancelled()) throw Cancelled("Sync cancelled before execution");

    const auto total = Executor::itemCount(p.resolved, p.plan);
    enter(Phase::Executing, std::to_string(total) + " items to apply");

    RunResult result;
    {
        Context ctx(*deps_.local, *deps_.remote, p.rootId, p.remote, cfg_.max_concurrency, total,
                    deps_.progress, [this] { return cancelled(); });
        result = Executor::run(ctx, p.resolved, p.plan);
    }

    result.watermarkBefore = p.watermark;

    if (cancelled()) {
        result.status = RunResult::Status::Cancelled;
        result.abortReason = "Sync cancelled during execution";
        result.watermarkAfter = p.watermark;
        return result;
    }

    // Advanced even when items failed; never lowered.
    const auto next = std::max(p.watermark, startedAt);
    auto state = deps_.state->load();
    state.watermark = next;
    state.remoteRootId = p.rootId;
    deps_.state->save(state);

    result.watermarkAfter = next;
    log::Registry::treesync()->info("[Session] Sync finished: {} succeeded, {} failed, watermark {}",
                                    result.succeededCount(), result.failedCount(), timestampToString(next));
    return result;
}
