#pragma once

#include "provider/Adapter.hpp"

#include <atomic>

namespace tw::provider {

// Logs every intent and counts it. Nothing leaves the process.
class SimulatedAdapter final : public Adapter {
public:
    void applyTrafficShift(const TrafficShift& shift) override;
    void applyTrafficRule(const traffic::model::Rule& rule) override;
    void createScalingAlarm(const scaling::model::Rule& rule, std::size_t ruleId) override;

    [[nodiscard]] bool live() const override { return false; }
    [[nodiscard]] std::string name() const override { return "simulated"; }

    [[nodiscard]] uint64_t intentCount() const { return intents_.load(); }

private:
    std::atomic<uint64_t> intents_{0};
};

}
