#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace ts::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::treesync()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::treesync()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log::Registry::treesync()->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true, std::memory_order_release);
    wake();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    log::Registry::treesync()->info("[{}] Service stopped.", serviceName_);
}

bool AsyncService::waitFor(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(waitMutex_);
    waitCv_.wait_for(lock, timeout, [this] { return woken_ || interruptFlag_.load(); });
    woken_ = false;
    return !interruptFlag_.load();
}

void AsyncService::wake() {
    {
        std::scoped_lock lock(waitMutex_);
        woken_ = true;
    }
    waitCv_.notify_all();
}
