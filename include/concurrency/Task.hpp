#pragma once

#include <future>

namespace tw::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// A task that reports its result through a future. Implementations must
// fulfil the promise (value or exception) on every path.
template <typename T>
struct PromisedTask : Task {
    std::promise<T> promise;

    PromisedTask() = default;
    explicit PromisedTask(std::promise<T> p) : promise(std::move(p)) {}

    std::future<T> getFuture() { return promise.get_future(); }
};

}
