#include "sync/tasks/KeepBoth.hpp"
#include "storage/LocalStore.hpp"
#include "storage/RemoteStore.hpp"
#include "sync/model/errors.hpp"
#include "log/Registry.hpp"

using namespace ts::sync::tasks;
using namespace ts::sync::model;

bool KeepBoth::apply() {
    if (!action.duplicatePath) throw std::logic_error("Keep-both without a duplicate path: " + action.path);
    if (!action.remote || !action.remote->remoteId)
        throw std::logic_error("Keep-both without a remote entry: " + action.path);

    const auto& copy = *action.duplicatePath;
    if (ctx.local.exists(copy))
        throw TransientIOFailure("Conflict copy already exists: " + copy);

    // Fresh mtime on the copy so the next run uploads it.
    ctx.local.writeBytes(copy, ctx.local.readBytes(action.path));
    log::Registry::sync()->info("[KeepBothTask] Kept local version of {} as {}", action.path, copy);

    const auto bytes = ctx.remote.download(*action.remote->remoteId);
    ctx.local.writeBytes(action.path, bytes, action.remote->remoteModifiedAt);
    return true;
}
