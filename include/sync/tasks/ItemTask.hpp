#pragma once

#include "concurrency/Task.hpp"
#include "sync/Context.hpp"
#include "sync/model/Action.hpp"
#include "sync/model/ScopedOp.hpp"

namespace ts::sync::tasks {

// One plan item. Runs apply(), isolates any failure to this item, reports the
// outcome to the context and settles the promise with the success flag.
struct ItemTask : concurrency::PromisedTask {
    Context& ctx;
    model::Action action;
    Category category;
    model::ScopedOp op;

    ItemTask(Context& ctx, model::Action action, Category category);

    void operator()() final;

protected:
    // Return false to leave the item in place (counted as skipped).
    virtual bool apply() = 0;

    [[nodiscard]] virtual const char* name() const = 0;

    [[nodiscard]] uint64_t sizeBytes() const;
};

}
