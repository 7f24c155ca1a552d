#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace tw::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(std::string name, unsigned int nThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks and joins the workers; running tasks finish first.
    void stop();

    void submit(std::shared_ptr<Task> task);

    [[nodiscard]] size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const;

private:
    void spawnWorker();

    std::string name_;
    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace tw::concurrency
