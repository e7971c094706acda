#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ts::concurrency;

ThreadPool::ThreadPool(unsigned int nThreads) {
    if (nThreads == 0) nThreads = 1;
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    if (stopFlag.exchange(true)) return;
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    if (stopFlag.load()) throw std::runtime_error("ThreadPool is stopped");
    {
        std::scoped_lock lock(mutex);
        queue.push(std::move(task));
    }
    cv.notify_one();
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (!task) continue;
            try {
                (*task)();
            } catch (const std::exception& e) {
                log::Registry::treesync()->error("[ThreadPool] Task threw: {}", e.what());
            }
        }
    });
}
