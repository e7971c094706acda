#include "sync/Executor.hpp"
#include "sync/tasks/Upload.hpp"
#include "sync/tasks/Download.hpp"
#include "sync/tasks/KeepBoth.hpp"
#include "sync/tasks/Delete.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <ranges>
#include <stdexcept>

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::util;

RunResult Executor::run(Context& ctx, const std::vector<Action>& resolved, const SyncPlan& plan) {
    runTransfers(ctx, Category::Conflicts, resolved);
    runTransfers(ctx, Category::Uploads, toActions(ActionType::Upload, plan.uploads));
    runTransfers(ctx, Category::Downloads, toActions(ActionType::Download, plan.downloads));
    runDeletions(ctx, Category::DeleteLocal, toActions(ActionType::DeleteLocal, plan.deleteLocal));
    runDeletions(ctx, Category::DeleteRemote, toActions(ActionType::DeleteRemote, plan.deleteRemote));

    auto result = ctx.tally();
    log::Registry::sync()->info("[Executor] {} succeeded, {} failed", result.succeededCount(), result.failedCount());
    return result;
}

void Executor::runTransfers(Context& ctx, const Category category, const std::vector<Action>& actions) {
    std::vector<const Action*> files;
    for (const auto& a : actions)
        if (!a.isContainer()) files.push_back(&a);

    if (const auto containers = actions.size() - files.size())
        log::Registry::sync()->debug("[Executor] Leaving {} container(s) in {} to their files", containers, to_string(category));

    if (files.empty()) return;
    ctx.planned(category, files.size());

    std::size_t skipped = 0;
    for (const auto* a : files) {
        if (ctx.cancelled()) { ++skipped; continue; }
        dispatch(ctx, category, *a);
    }

    ctx.processFutures();
    if (skipped) ctx.skipped(category, skipped);
}

void Executor::runDeletions(Context& ctx, const Category category, const std::vector<Action>& actions) {
    if (actions.empty()) return;
    ctx.planned(category, actions.size());

    std::vector<const Action*> containers, files;
    for (const auto& a : actions) (a.isContainer() ? containers : files).push_back(&a);

    std::size_t skipped = 0;

    for (const auto* a : files) {
        if (ctx.cancelled()) { ++skipped; continue; }
        dispatch(ctx, category, *a);
    }
    ctx.processFutures();

    // Deepest first, so a folder emptied by its children's removal goes too.
    std::ranges::stable_sort(containers, [](const Action* a, const Action* b) {
        return depthOf(a->path) > depthOf(b->path);
    });

    for (const auto* a : containers) {
        if (ctx.cancelled()) { ++skipped; continue; }
        runInline(ctx, category, *a);
    }

    if (skipped) ctx.skipped(category, skipped);
}

std::size_t Executor::itemCount(const std::vector<Action>& resolved, const SyncPlan& plan) {
    return resolved.size() + fileCount(plan.uploads) + fileCount(plan.downloads) +
           plan.deleteLocal.size() + plan.deleteRemote.size();
}

std::size_t Executor::fileCount(const std::vector<PathEntry>& entries) {
    return static_cast<std::size_t>(std::ranges::count_if(entries, [](const PathEntry& e) { return !e.isContainer; }));
}

void Executor::dispatch(Context& ctx, const Category category, const Action& action) {
    ctx.push(makeTask(ctx, category, action));
}

void Executor::runInline(Context& ctx, const Category category, const Action& action) {
    const auto task = makeTask(ctx, category, action);
    (*task)();
}

std::shared_ptr<ts::concurrency::PromisedTask> Executor::makeTask(Context& ctx, const Category category, const Action& action) {
    switch (action.type) {
    case ActionType::Upload:
        return std::make_shared<tasks::Upload>(ctx, action, category);
    case ActionType::Download:
        return std::make_shared<tasks::Download>(ctx, action, category);
    case ActionType::KeepBoth:
        return std::make_shared<tasks::KeepBoth>(ctx, action, category);
    case ActionType::DeleteLocal:
        return std::make_shared<tasks::Delete>(ctx, action, category, tasks::Delete::Type::LOCAL);
    case ActionType::DeleteRemote:
        return std::make_shared<tasks::Delete>(ctx, action, category, tasks::Delete::Type::REMOTE);
    default:
        throw std::invalid_argument("Unknown action type for " + action.path);
    }
}

std::vector<Action> Executor::toActions(const ActionType type, const std::vector<PathEntry>& entries) {
    std::vector<Action> actions;
    actions.reserve(entries.size());

    for (const auto& e : entries) {
        Action a{.type = type, .path = e.path};
        if (type == ActionType::Upload || type == ActionType::DeleteLocal) a.local = e;
        else a.remote = e;
        actions.push_back(std::move(a));
    }

    return actions;
}
