#include "sync/tasks/Download.hpp"
#include "storage/LocalStore.hpp"
#include "storage/RemoteStore.hpp"

#include <stdexcept>

using namespace ts::sync::tasks;
using namespace ts::sync::model;

bool Download::apply() {
    if (!action.remote) throw std::logic_error("Download without a remote entry: " + action.path);
    const auto& entry = *action.remote;
    if (entry.isContainer) throw std::logic_error("Containers are never downloaded: " + action.path);
    if (!entry.remoteId) throw std::logic_error("Remote entry has no id: " + action.path);

    const auto bytes = ctx.remote.download(*entry.remoteId);
    ctx.local.writeBytes(action.path, bytes, entry.remoteModifiedAt);
    return true;
}
