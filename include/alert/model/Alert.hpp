#pragma once

#include "health/model/Monitor.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tw::alert::model {

struct Alert {
    uint64_t id{};
    std::chrono::system_clock::time_point timestamp{};
    std::string type = "endpoint_unhealthy";
    std::string endpoint;
    health::model::State state{health::model::State::Unhealthy};
    unsigned int consecutive_failures{};
    std::optional<std::string> last_error;
    std::string action_taken = "failover_attempted";
    bool failover_success = false;
    std::optional<std::string> failover_target;
};

void to_json(nlohmann::json& j, const Alert& a);

}
