#include "sync/tasks/Delete.hpp"
#include "storage/LocalStore.hpp"
#include "storage/RemoteStore.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ts::sync::tasks;
using namespace ts::sync::model;

Delete::Delete(Context& ctx, Action action, const Category category, const Type type)
    : ItemTask(ctx, std::move(action), category), type(type) {}

bool Delete::apply() {
    return type == Type::LOCAL ? applyLocal() : applyRemote();
}

bool Delete::applyLocal() {
    if (!action.local) throw std::logic_error("Local delete without a local entry: " + action.path);

    if (!action.local->isContainer) {
        ctx.local.moveToTrash(action.path);
        return true;
    }

    if (!ctx.local.listContainer(action.path).empty()) {
        log::Registry::sync()->info("[DeleteTask] Keeping local folder {}, it is not empty", action.path);
        return false;
    }

    ctx.local.removeEmptyContainer(action.path);
    return true;
}

bool Delete::applyRemote() {
    if (!action.remote || !action.remote->remoteId)
        throw std::logic_error("Remote delete without a remote id: " + action.path);

    const auto& id = *action.remote->remoteId;

    if (action.remote->isContainer) {
        const auto page = ctx.remote.listChildren(id, std::nullopt);
        if (!page.entries.empty() || page.nextPageToken) {
            log::Registry::sync()->info("[DeleteTask] Keeping remote folder {}, it is not empty", action.path);
            return false;
        }
    }

    ctx.remote.trash(id);
    if (action.remote->isContainer) ctx.forgetRemoteContainer(action.path);
    return true;
}
