#pragma once

#include "provider/Adapter.hpp"

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace tw::provider {

// POSTs each intent as {"kind": ..., "payload": ...} to one URL.
// A transport error or non-2xx reply throws std::runtime_error.
class WebhookAdapter final : public Adapter {
public:
    WebhookAdapter(std::string url, std::chrono::milliseconds timeout,
                   std::string userAgent = "TrafficWarden/1.0");

    void applyTrafficShift(const TrafficShift& shift) override;
    void applyTrafficRule(const traffic::model::Rule& rule) override;
    void createScalingAlarm(const scaling::model::Rule& rule, std::size_t ruleId) override;

    [[nodiscard]] bool live() const override { return true; }
    [[nodiscard]] std::string name() const override { return "webhook"; }

private:
    std::string url_;
    std::chrono::milliseconds timeout_;
    std::string userAgent_;

    void post(const std::string& kind, const nlohmann::json& payload) const;
};

}
