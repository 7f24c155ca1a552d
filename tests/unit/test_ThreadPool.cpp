#include <gtest/gtest.h>

#include "concurrency/ThreadPool.hpp"
#include "concurrency/Task.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

using namespace tw::concurrency;

namespace {

struct SquareTask : PromisedTask<int> {
    int n;
    explicit SquareTask(const int n) : n(n) {}
    void operator()() override { promise.set_value(n * n); }
};

struct ThrowingTask : PromisedTask<int> {
    void operator()() override {
        try {
            throw std::runtime_error("boom");
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }
};

struct CountingTask : Task {
    std::atomic<int>& counter;
    explicit CountingTask(std::atomic<int>& c) : counter(c) {}
    void operator()() override { ++counter; }
};

}

TEST(ThreadPoolTest, RunsSubmittedTasks) {
    ThreadPool pool("test", 3);
    EXPECT_EQ(pool.workerCount(), 3u);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        auto t = std::make_shared<SquareTask>(i);
        futures.push_back(t->getFuture());
        pool.submit(t);
    }

    for (int i = 0; i < 20; ++i) EXPECT_EQ(futures[i].get(), i * i);
}

TEST(ThreadPoolTest, ExceptionsTravelThroughFuture) {
    ThreadPool pool("test", 1);
    auto t = std::make_shared<ThrowingTask>();
    auto f = t->getFuture();
    pool.submit(t);
    EXPECT_THROW(f.get(), std::runtime_error);

    // The worker survives
    auto ok = std::make_shared<SquareTask>(3);
    auto g = ok->getFuture();
    pool.submit(ok);
    EXPECT_EQ(g.get(), 9);
}

TEST(ThreadPoolTest, SubmitAfterStopThrows) {
    ThreadPool pool("test", 2);
    pool.stop();
    EXPECT_EQ(pool.workerCount(), 0u);

    std::atomic<int> counter{0};
    EXPECT_THROW(pool.submit(std::make_shared<CountingTask>(counter)), std::runtime_error);
    EXPECT_EQ(counter.load(), 0);
}

TEST(ThreadPoolTest, StopIsIdempotent) {
    ThreadPool pool("test", 2);
    pool.stop();
    EXPECT_NO_THROW(pool.stop());
}

TEST(ThreadPoolTest, StopDropsQueuedTasks) {
    ThreadPool pool("test", 0);
    std::atomic<int> counter{0};
    pool.submit(std::make_shared<CountingTask>(counter));
    pool.submit(std::make_shared<CountingTask>(counter));
    EXPECT_EQ(pool.queueDepth(), 2u);

    pool.stop();
    EXPECT_EQ(pool.queueDepth(), 0u);
    EXPECT_EQ(counter.load(), 0);
}
