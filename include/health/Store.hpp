#pragma once

#include "health/model/Monitor.hpp"
#include "health/model/Outcome.hpp"
#include "health/StateMachine.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tw::health {

struct Registration {
    model::Monitor monitor;
    bool replaced = false;   // identity was already registered
};

// Endpoint identity -> monitor. Readers get copies, never references into the map.
class Store {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    Registration upsert(const std::string& endpoint, const model::CheckConfig& config, TimePoint now);

    bool remove(const std::string& endpoint);

    void clear();

    // Runs the state machine against the stored monitor and writes the result back.
    // Returns nullopt when the endpoint was removed or re-registered since `generation`.
    std::optional<Transition> apply(const std::string& endpoint, uint64_t generation,
                                    const model::Outcome& outcome, TimePoint now);

    [[nodiscard]] std::optional<model::Monitor> get(const std::string& endpoint) const;

    // Ordered by endpoint identity.
    [[nodiscard]] std::vector<model::Monitor> snapshot() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, model::Monitor> monitors_;
    uint64_t nextGeneration_ = 1;
};

}
