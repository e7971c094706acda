#include "sync/Controller.hpp"
#include "sync/Session.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ts::sync;
using namespace ts::sync::model;
using namespace std::chrono;

Controller::Controller(std::shared_ptr<Session> session, Schedule schedule, Observer observer)
    : AsyncService("SyncController"),
      session_(std::move(session)),
      schedule_(schedule),
      observer_(std::move(observer)) {
    if (!session_) throw std::invalid_argument("Controller requires a session");
    if (schedule_.interval <= milliseconds::zero()) schedule_.interval = minutes(1);
}

Controller::~Controller() {
    stop();
}

void Controller::stop() {
    session_->cancel();
    AsyncService::stop();
}

void Controller::runNow() {
    runNowFlag_.store(true);
    wake();
}

std::optional<RunResult> Controller::lastResult() const {
    std::scoped_lock lock(resultMutex_);
    return lastResult_;
}

std::size_t Controller::runCount() const {
    std::scoped_lock lock(resultMutex_);
    return runCount_;
}

void Controller::runLoop() {
    if (schedule_.runOnStartup) runOnce();

    auto nextRun = steady_clock::now() + schedule_.interval;

    while (!interruptFlag_.load()) {
        const auto wait = schedule_.autoSync
            ? duration_cast<milliseconds>(nextRun - steady_clock::now())
            : milliseconds(hours(24));

        if (wait > milliseconds::zero() && !waitFor(wait)) break;
        if (interruptFlag_.load()) break;

        const bool manual = runNowFlag_.exchange(false);
        const bool due = schedule_.autoSync && steady_clock::now() >= nextRun;
        if (!manual && !due) continue;

        runOnce();
        if (schedule_.autoSync) nextRun = steady_clock::now() + schedule_.interval;
    }
}

void Controller::runOnce() {
    const auto result = session_->run();

    if (result.status == RunResult::Status::Busy)
        log::Registry::sync()->info("[SyncController] Skipped scheduled run, a sync is already active");
    else if (!result.completed())
        log::Registry::sync()->warn("[SyncController] Run ended {}: {}", to_string(result.status), result.abortReason);

    {
        std::scoped_lock lock(resultMutex_);
        lastResult_ = result;
        ++runCount_;
    }

    if (observer_) observer_(result);
}
