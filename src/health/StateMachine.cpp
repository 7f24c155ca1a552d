#include "health/StateMachine.hpp"

#include <fmt/core.h>

using namespace tw::health;
using namespace tw::health::model;

Transition StateMachine::apply(const Monitor& current, const Outcome& outcome,
                               const std::chrono::system_clock::time_point now) {
    Transition t{current, {}, false};
    auto& m = t.monitor;
    m.last_probe_at = now;

    if (const auto code = statusCode(outcome)) {
        if (*code == m.config.expected_status) {
            m.state = State::Healthy;
            m.consecutive_failures = 0;
            ++m.success_count;
            m.last_response_time_ms = responseTimeMs(outcome);
            t.success = true;
            return t;
        }
        recordFailure(t, State::Unhealthy, fmt::format("HTTP {}", *code));
        return t;
    }

    if (std::holds_alternative<outcome::Timeout>(outcome))
        recordFailure(t, State::TimedOut, "Request timeout");
    else if (std::holds_alternative<outcome::ConnectionFailed>(outcome))
        recordFailure(t, State::ConnectionError, "Connection failed");
    else
        recordFailure(t, State::ErrorOther, std::get<outcome::OtherError>(outcome).message);

    return t;
}

void StateMachine::recordFailure(Transition& t, const State failureState, std::string error) {
    auto& m = t.monitor;
    ++m.consecutive_failures;
    ++m.failure_count;
    m.last_error = std::move(error);

    if (m.consecutive_failures < m.config.failure_threshold) {
        m.state = State::Degraded;
        return;
    }

    // At or past the threshold every failing probe escalates again.
    m.state = failureState;
    t.effects = {Effect::RaiseAlert, Effect::TriggerFailover};
}
