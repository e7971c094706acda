#pragma once

#include <future>

namespace ts::concurrency {

// true when the unit of work succeeded
using Outcome = bool;

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// A task the submitter can wait on. future() may be taken once, before submit.
struct PromisedTask : Task {
    [[nodiscard]] std::future<Outcome> future() { return promise_.get_future(); }

protected:
    void settle(const Outcome ok) { promise_.set_value(ok); }

private:
    std::promise<Outcome> promise_;
};

}
