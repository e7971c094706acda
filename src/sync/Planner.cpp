#include "sync/Planner.hpp"
#include "log/Registry.hpp"

using namespace ts::sync;
using namespace ts::sync::model;
using ts::util::Timestamp;

namespace {

// Local view of the path with the remote identity attached.
PathEntry mergedFromLocal(const PathEntry& L, const PathEntry& R) {
    PathEntry e = L;
    e.remoteModifiedAt = R.remoteModifiedAt;
    e.remoteId = R.remoteId;
    e.contentHash = R.contentHash;
    return e;
}

PathEntry mergedFromRemote(const PathEntry& L, const PathEntry& R) {
    PathEntry e = R;
    e.localModifiedAt = L.localModifiedAt;
    return e;
}

}

SyncPlan Planner::build(const Index& local, const Index& remote, const Timestamp watermark) {
    SyncPlan plan;

    // Merge-join: both indices iterate in path order.
    auto l = local.begin();
    auto r = remote.begin();

    while (l != local.end() || r != remote.end()) {
        if (r == remote.end() || (l != local.end() && l->first < r->first)) {
            planLocalOnly(plan, l->second, watermark);
            ++l;
        } else if (l == local.end() || r->first < l->first) {
            planRemoteOnly(plan, r->second, watermark);
            ++r;
        } else {
            planBoth(plan, l->second, r->second, watermark);
            ++l;
            ++r;
        }
    }

    log::Registry::sync()->debug("[Planner] {} uploads, {} downloads, {} local deletes, {} remote deletes, {} conflicts",
                                 plan.uploads.size(), plan.downloads.size(), plan.deleteLocal.size(),
                                 plan.deleteRemote.size(), plan.conflicts.size());
    return plan;
}

void Planner::planLocalOnly(SyncPlan& plan, const PathEntry& L, const Timestamp watermark) {
    if (watermark == 0 || L.localStamp() > watermark) plan.uploads.push_back(L);
    else plan.deleteLocal.push_back(L);
}

void Planner::planRemoteOnly(SyncPlan& plan, const PathEntry& R, const Timestamp watermark) {
    if (watermark == 0 || R.remoteStamp() > watermark) plan.downloads.push_back(R);
    else plan.deleteRemote.push_back(R);
}

void Planner::planBoth(SyncPlan& plan, const PathEntry& L, const PathEntry& R, const Timestamp watermark) {
    if (L.isContainer && R.isContainer) return;

    if (L.isContainer != R.isContainer) {
        log::Registry::sync()->warn("[Planner] '{}' is a {} locally but a {} remotely, leaving both untouched",
                                    L.path, L.isContainer ? "folder" : "file", R.isContainer ? "folder" : "file");
        return;
    }

    const auto lm = L.localStamp();
    const auto rm = R.remoteStamp();

    if (watermark != 0 && lm != rm && lm > watermark && rm > watermark) {
        plan.conflicts.push_back({L.path, mergedFromLocal(L, R), mergedFromRemote(L, R)});
        return;
    }

    if (lm > rm && lm > watermark) plan.uploads.push_back(mergedFromLocal(L, R));
    else if (rm > lm && rm > watermark) plan.downloads.push_back(mergedFromRemote(L, R));
}
