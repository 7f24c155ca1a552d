#include "provider/SimulatedAdapter.hpp"
#include "log/Registry.hpp"

using namespace tw::provider;

void SimulatedAdapter::applyTrafficShift(const TrafficShift& shift) {
    ++intents_;
    log::Registry::provider()->info("[SimulatedAdapter] Traffic shift {} -> {} at {}%",
                                    shift.from, shift.to, shift.weight);
}

void SimulatedAdapter::applyTrafficRule(const traffic::model::Rule& rule) {
    ++intents_;
    log::Registry::provider()->info("[SimulatedAdapter] Traffic rule #{}: {} -> {} at {}%",
                                    rule.id, rule.source_pattern, rule.target, rule.weight);
}

void SimulatedAdapter::createScalingAlarm(const scaling::model::Rule& rule, const std::size_t ruleId) {
    ++intents_;
    log::Registry::provider()->info("[SimulatedAdapter] Alarm {} (threshold {})",
                                    alarmName(rule, ruleId), rule.threshold);
}
