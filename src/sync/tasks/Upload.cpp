#include "sync/tasks/Upload.hpp"
#include "storage/LocalStore.hpp"
#include "storage/RemoteStore.hpp"
#include "sync/model/errors.hpp"
#include "util/fsPath.hpp"
#include "util/Magic.hpp"

#include <stdexcept>

using namespace ts::sync::tasks;
using namespace ts::sync::model;
using namespace ts::storage;
using namespace ts::util;

bool Upload::apply() {
    if (!action.local) throw std::logic_error("Upload without a local entry: " + action.path);
    const auto& entry = *action.local;
    if (entry.isContainer) throw std::logic_error("Containers are never uploaded: " + action.path);

    UploadRequest req;
    req.name = lastSegment(action.path);
    req.content = ctx.local.readBytes(action.path);
    req.mimeType = inferMimeType(action.path, req.content);
    req.parentId = ctx.ensureRemotePath(parentOf(action.path));
    req.modifiedAt = entry.localModifiedAt;

    if (entry.remoteId) req.existingId = entry.remoteId;
    else if (action.remote && action.remote->remoteId) req.existingId = action.remote->remoteId;

    ctx.remote.upload(req);
    return true;
}
