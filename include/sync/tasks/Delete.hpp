#pragma once

#include "sync/tasks/ItemTask.hpp"

namespace ts::sync::tasks {

// Moves a file to the trash of one side. Containers are only removed while
// empty; a container that still holds anything is left in place.
struct Delete final : ItemTask {
    enum class Type { LOCAL, REMOTE };

    Type type;

    Delete(Context& ctx, model::Action action, Category category, Type type);

protected:
    bool apply() override;
    [[nodiscard]] const char* name() const override { return "DeleteTask"; }

private:
    bool applyLocal();
    bool applyRemote();
};

}
