#pragma once

#include "sync/tasks/ItemTask.hpp"

namespace ts::sync::tasks {

// Copies the local file to the conflict path, then downloads the remote copy
// over the original path.
struct KeepBoth final : ItemTask {
    using ItemTask::ItemTask;

protected:
    bool apply() override;
    [[nodiscard]] const char* name() const override { return "KeepBothTask"; }
};

}
