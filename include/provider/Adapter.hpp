#pragma once

#include "traffic/model/Rule.hpp"
#include "scaling/model/Rule.hpp"

#include <chrono>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tw::provider {

struct TrafficShift {
    std::string from;
    std::string to;
    int weight = 100;
};

void to_json(nlohmann::json& j, const TrafficShift& s);

// Outbound boundary to whatever actually moves traffic or scales capacity.
// Calls are fire-and-forget intents; failures are reported by throwing.
class Adapter {
public:
    virtual ~Adapter() = default;

    virtual void applyTrafficShift(const TrafficShift& shift) = 0;
    virtual void applyTrafficRule(const traffic::model::Rule& rule) = 0;
    virtual void createScalingAlarm(const scaling::model::Rule& rule, std::size_t ruleId) = 0;

    // True when intents leave the process.
    [[nodiscard]] virtual bool live() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

std::string alarmName(const scaling::model::Rule& rule, std::size_t ruleId);

}
