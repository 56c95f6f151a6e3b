#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mds::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 1);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drains the queue, then joins every worker.
    void stop();

    void submit(std::shared_ptr<Task> task);

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace mds::concurrency
