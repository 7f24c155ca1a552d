#pragma once

#include <atomic>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace tw::stats::model {

struct MetricsSnapshot {
    uint64_t total_requests{};
    uint64_t successful_health_checks{};
    uint64_t failed_health_checks{};
    uint64_t traffic_routes_created{};
    uint64_t auto_scale_triggers{};
    uint64_t provider_failures{};
};

// Cumulative counters. Nothing here is ever decremented.
struct Metrics {
    std::atomic<uint64_t> total_requests{0};
    std::atomic<uint64_t> successful_health_checks{0};
    std::atomic<uint64_t> failed_health_checks{0};
    std::atomic<uint64_t> traffic_routes_created{0};
    std::atomic<uint64_t> auto_scale_triggers{0};
    std::atomic<uint64_t> provider_failures{0};   // adapter intents that threw

    [[nodiscard]] MetricsSnapshot snapshot() const;

    // Zeroes everything except total_requests, which counts the reset itself.
    void reset();
};

void to_json(nlohmann::json& j, const MetricsSnapshot& m);

}
