#include "health/model/Monitor.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace tw::health::model;

Monitor::Monitor(std::string endpoint, const CheckConfig& config, const TimePoint createdAt)
    : endpoint(std::move(endpoint)), config(config), created_at(createdAt) {}

bool Monitor::isDue(const TimePoint now) const {
    if (!last_probe_at) return true;
    return now - *last_probe_at >= config.poll_interval;
}

void Monitor::resetLiveState() {
    state = State::Initializing;
    consecutive_failures = 0;
    last_probe_at.reset();
    last_response_time_ms.reset();
    last_error.reset();
}

bool tw::health::model::isFailureState(const State s) {
    return s == State::Unhealthy || s == State::TimedOut ||
           s == State::ConnectionError || s == State::ErrorOther;
}

std::string tw::health::model::to_string(const State s) {
    switch (s) {
        case State::Initializing: return "initializing";
        case State::Healthy: return "healthy";
        case State::Degraded: return "degraded";
        case State::Unhealthy: return "unhealthy";
        case State::TimedOut: return "timeout";
        case State::ConnectionError: return "connection_error";
        case State::ErrorOther: return "error";
        default: throw std::invalid_argument("Unknown health state");
    }
}

State tw::health::model::stateFromString(const std::string& str) {
    if (str == "initializing") return State::Initializing;
    if (str == "healthy") return State::Healthy;
    if (str == "degraded") return State::Degraded;
    if (str == "unhealthy") return State::Unhealthy;
    if (str == "timeout") return State::TimedOut;
    if (str == "connection_error") return State::ConnectionError;
    if (str == "error") return State::ErrorOther;
    throw std::invalid_argument("Unknown health state: " + str);
}

void tw::health::model::to_json(nlohmann::json& j, const CheckConfig& c) {
    j = {
        {"expected_status", c.expected_status},
        {"timeout_ms", c.timeout.count()},
        {"interval_seconds", std::chrono::duration_cast<std::chrono::seconds>(c.poll_interval).count()},
        {"failure_threshold", c.failure_threshold}
    };
}
