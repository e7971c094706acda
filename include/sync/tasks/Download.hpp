#pragma once

#include "sync/tasks/ItemTask.hpp"

namespace ts::sync::tasks {

struct Download final : ItemTask {
    using ItemTask::ItemTask;

protected:
    bool apply() override;
    [[nodiscard]] const char* name() const override { return "DownloadTask"; }
};

}
