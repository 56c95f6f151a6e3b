#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

using namespace mds::concurrency;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    const unsigned int n = nThreads == 0 ? 1 : nThreads;
    for (unsigned int i = 0; i < n; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    stopFlag.store(true);
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    if (stopFlag.load()) throw std::runtime_error("ThreadPool::submit called after stop()");
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

            // Tasks report through their promise; anything escaping here is a bug in the task.
            try {
                (*task)();
            } catch (const std::exception& e) {
                log::Registry::sync()->error("[ThreadPool] Task escaped with exception: {}", e.what());
            }
        }
    });
}
