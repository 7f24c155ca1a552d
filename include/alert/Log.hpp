#pragma once

#include "alert/model/Alert.hpp"

#include <chrono>
#include <deque>
#include <shared_mutex>
#include <vector>

namespace tw::alert {

// Bounded FIFO of raised alerts. Ids keep counting across clear().
class Log {
public:
    static constexpr size_t CAPACITY = 100;

    // Assigns the id, stores the alert and returns the stored copy.
    model::Alert append(model::Alert alert);

    // The newest `limit` alerts, oldest first.
    [[nodiscard]] std::vector<model::Alert> recent(size_t limit) const;

    [[nodiscard]] size_t countSince(std::chrono::system_clock::time_point cutoff) const;

    [[nodiscard]] size_t size() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::deque<model::Alert> alerts_;
    uint64_t nextId_ = 1;
};

}
