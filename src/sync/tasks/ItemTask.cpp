#include "sync/tasks/ItemTask.hpp"
#include "log/Registry.hpp"

using namespace ts::sync::tasks;
using namespace ts::sync::model;

ItemTask::ItemTask(Context& ctx, Action action, const Category category)
    : ctx(ctx), action(std::move(action)), category(category) {}

uint64_t ItemTask::sizeBytes() const {
    if (action.local && !action.local->isContainer) return action.local->size;
    if (action.remote && !action.remote->isContainer) return action.remote->size;
    return 0;
}

void ItemTask::operator()() {
    // Queued but not yet started when the run was cancelled.
    if (ctx.cancelled()) {
        ctx.skipped(category, 1);
        settle(true);
        return;
    }

    const auto message = progressMessage(category, action);
    bool applied = false;

    try {
        op.start(sizeBytes());
        applied = apply();
        op.success = true;
    } catch (const std::exception& e) {
        op.stop();
        log::Registry::sync()->error("[{}] {} failed: {}", name(), action.path, e.what());
        ctx.failed(category, action.type, action.path, message, e.what());
        settle(false);
        return;
    }

    op.stop();

    if (applied) {
        log::Registry::sync()->debug("[{}] {} done in {} ms ({} bytes)", name(), action.path, op.duration_ms(), op.size_bytes);
        ctx.succeeded(category, action.path, message);
    } else {
        ctx.keptInPlace(category, action.path, message);
    }

    settle(true);
}
