#include "provider/Adapter.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace tw::provider;

void tw::provider::to_json(nlohmann::json& j, const TrafficShift& s) {
    j = {
        {"from", s.from},
        {"to", s.to},
        {"weight", s.weight}
    };
}

std::string tw::provider::alarmName(const scaling::model::Rule& rule, const std::size_t ruleId) {
    return fmt::format("trafficwarden-{}-{}-{}",
                       scaling::model::to_string(rule.metric),
                       scaling::model::to_string(rule.action),
                       ruleId);
}
