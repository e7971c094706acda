#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace ts::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    // Sleeps up to `timeout`; returns early on stop() or wake().
    // Returns false once the service has been interrupted.
    bool waitFor(std::chrono::milliseconds timeout);

    void wake();

    virtual void runLoop() = 0;

private:
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    bool woken_{false};
};

}
