#pragma once

#include "concurrency/AsyncService.hpp"
#include "sync/model/RunResult.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace ts::sync {

class Session;

// Background scheduler: runs the session every interval while auto-sync is
// on, optionally once at startup. runNow() wakes it early.
class Controller final : public concurrency::AsyncService {
public:
    struct Schedule {
        bool autoSync{false};
        std::chrono::milliseconds interval{std::chrono::minutes(30)};
        bool runOnStartup{false};
    };

    using Observer = std::function<void(const model::RunResult&)>;

    Controller(std::shared_ptr<Session> session, Schedule schedule, Observer observer = {});
    ~Controller() override;

    void stop() override;

    void runNow();

    [[nodiscard]] std::optional<model::RunResult> lastResult() const;
    [[nodiscard]] std::size_t runCount() const;

protected:
    void runLoop() override;

private:
    std::shared_ptr<Session> session_;
    Schedule schedule_;
    Observer observer_;

    std::atomic<bool> runNowFlag_{false};

    mutable std::mutex resultMutex_;
    std::optional<model::RunResult> lastResult_;
    std::size_t runCount_{0};

    void runOnce();
};

}
