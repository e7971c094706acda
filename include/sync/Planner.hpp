#pragma once

#include "sync/model/Plan.hpp"

namespace ts::sync {

// Pure function of two indices and a watermark. Never touches a store.
struct Planner {
    static model::SyncPlan build(const model::Index& local, const model::Index& remote, util::Timestamp watermark);

private:
    static void planLocalOnly(model::SyncPlan& plan, const model::PathEntry& L, util::Timestamp watermark);
    static void planRemoteOnly(model::SyncPlan& plan, const model::PathEntry& R, util::Timestamp watermark);
    static void planBoth(model::SyncPlan& plan, const model::PathEntry& L, const model::PathEntry& R,
                         util::Timestamp watermark);
};

}
