#pragma once

#include "health/model/Monitor.hpp"
#include "health/model/Outcome.hpp"

#include <chrono>
#include <vector>

namespace tw::health {

enum class Effect { RaiseAlert, TriggerFailover };

struct Transition {
    model::Monitor monitor;          // the monitor after the probe
    std::vector<Effect> effects;
    bool success = false;            // counted as a successful probe

    [[nodiscard]] bool escalates() const { return !effects.empty(); }
};

// Pure: no clock, no network. `now` is stamped as the probe time.
class StateMachine {
public:
    [[nodiscard]] static Transition apply(const model::Monitor& current,
                                          const model::Outcome& outcome,
                                          std::chrono::system_clock::time_point now);

private:
    static void recordFailure(Transition& t, model::State failureState, std::string error);
};

}
