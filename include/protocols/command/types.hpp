#pragma once

#include "scaling/model/Rule.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace tw::protocols::command {

struct HealthCheck {
    std::string endpoint;
    std::chrono::seconds interval = std::chrono::seconds(30);
};

struct Unregister {
    std::string endpoint;
};

struct RouteTraffic {
    std::string source;
    std::string target;
    long long weight = 100;
};

struct AutoScale {
    scaling::model::Metric metric = scaling::model::Metric::Cpu;
    double threshold{};
    scaling::model::Action action = scaling::model::Action::ScaleUp;
};

struct Status {
    std::optional<std::string> target;   // unset = whole system
};

struct Alerts {};
struct Recommendations {};
struct Endpoints {};
struct Metrics {};
struct Help {};
struct Clear {};

struct Unknown {
    std::string line;
};

using Command = std::variant<HealthCheck, Unregister, RouteTraffic, AutoScale, Status,
                             Alerts, Recommendations, Endpoints, Metrics, Help, Clear, Unknown>;

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;
    std::string stderr_text;
    nlohmann::json data;               // machine-readable payload
    bool has_data = false;
};

}
