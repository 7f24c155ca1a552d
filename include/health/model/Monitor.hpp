#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tw::health::model {

enum class State {
    Initializing,
    Healthy,
    Degraded,
    Unhealthy,
    TimedOut,
    ConnectionError,
    ErrorOther,
};

// Unhealthy, TimedOut, ConnectionError and ErrorOther: the threshold has been reached.
[[nodiscard]] bool isFailureState(State s);

struct CheckConfig {
    int expected_status = 200;
    std::chrono::milliseconds timeout = std::chrono::seconds(10);
    std::chrono::milliseconds poll_interval = std::chrono::seconds(30);
    unsigned int failure_threshold = 3;
};

struct Monitor {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string endpoint;
    CheckConfig config;

    State state{State::Initializing};
    unsigned int consecutive_failures{};
    uint64_t success_count{}, failure_count{};

    std::optional<TimePoint> last_probe_at;
    std::optional<double> last_response_time_ms;
    std::optional<std::string> last_error;
    TimePoint created_at{};

    // Bumped on every (re-)registration; lets the loop drop results for a superseded config.
    uint64_t generation{};

    Monitor() = default;
    Monitor(std::string endpoint, const CheckConfig& config, TimePoint createdAt);

    [[nodiscard]] bool isDue(TimePoint now) const;

    // Back to Initializing with the live counters cleared; lifetime totals survive.
    void resetLiveState();
};

std::string to_string(State s);
State stateFromString(const std::string& str);

void to_json(nlohmann::json& j, const CheckConfig& c);

}
