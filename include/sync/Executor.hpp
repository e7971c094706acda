#pragma once

#include "sync/Context.hpp"
#include "sync/model/Action.hpp"
#include "sync/model/Plan.hpp"
#include "sync/model/RunResult.hpp"

#include <vector>

namespace ts::sync {

// Applies a resolved plan in a fixed order: conflicts, uploads, downloads,
// local deletions, remote deletions. Each category is a barrier.
// Containers in the transfer categories are no-ops: parents are created on
// demand by the file transfers that need them.
class Executor {
public:
    static model::RunResult run(Context& ctx, const std::vector<model::Action>& resolved, const model::SyncPlan& plan);

    // Items that will report progress: every conflict and deletion, and the
    // files among uploads and downloads.
    static std::size_t itemCount(const std::vector<model::Action>& resolved, const model::SyncPlan& plan);

    static std::size_t fileCount(const std::vector<model::PathEntry>& entries);

private:
    static void runTransfers(Context& ctx, Category category, const std::vector<model::Action>& actions);
    static void runDeletions(Context& ctx, Category category, const std::vector<model::Action>& actions);

    static void dispatch(Context& ctx, Category category, const model::Action& action);

    // Runs one item on the calling thread.
    static void runInline(Context& ctx, Category category, const model::Action& action);

    static std::shared_ptr<concurrency::PromisedTask> makeTask(Context& ctx, Category category, const model::Action& action);

    static std::vector<model::Action> toActions(model::ActionType type, const std::vector<model::PathEntry>& entries);
};

}
