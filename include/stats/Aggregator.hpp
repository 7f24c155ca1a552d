#pragma once

#include "health/model/Monitor.hpp"
#include "alert/model/Alert.hpp"
#include "stats/model/Metrics.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace tw::runtime { struct Context; }

namespace tw::stats {

struct EndpointDetail {
    std::string endpoint;
    health::model::State state{health::model::State::Initializing};
    std::string uptime;
    uint64_t success_count{}, failure_count{};
    unsigned int consecutive_failures{};
    std::optional<std::string> last_check;
    std::optional<double> response_time_ms;
    std::optional<std::string> last_error;
    health::model::CheckConfig config;
    std::string created_at;
};

struct SystemSummary {
    std::string overall_status;
    size_t total_endpoints{};
    size_t healthy_endpoints{};
    size_t traffic_rules{};
    size_t auto_scale_rules{};
    size_t recent_alerts{};
    double average_response_time_ms{};
    bool monitoring_active = false;
    std::string uptime;      // since the engine started, e.g. "3h 12m 5s"
    model::MetricsSnapshot metrics;
};

// Read-only views over a context. Deterministic for an unchanged state and clock.
class Aggregator {
public:
    static constexpr double SLOW_RESPONSE_MS = 2000.0;

    explicit Aggregator(std::shared_ptr<runtime::Context> ctx);

    [[nodiscard]] static std::string uptime(uint64_t successes, uint64_t failures);

    // "healthy" only when there is at least one endpoint and every endpoint is Healthy.
    [[nodiscard]] static std::string overallStatus(const std::vector<health::model::Monitor>& monitors);

    [[nodiscard]] static double averageResponseTime(const std::vector<health::model::Monitor>& monitors);

    [[nodiscard]] static EndpointDetail detail(const health::model::Monitor& m);

    // Case-insensitive substring match on the endpoint identity; empty filter matches all.
    [[nodiscard]] std::vector<EndpointDetail> endpoints(const std::string& filter = {}) const;

    [[nodiscard]] SystemSummary summary(bool monitoringActive) const;

    [[nodiscard]] std::vector<std::string> recommendations(bool monitoringActive) const;

    [[nodiscard]] size_t recentAlertCount() const;

private:
    std::shared_ptr<runtime::Context> ctx_;
};

std::string formatDuration(std::chrono::seconds d);

void to_json(nlohmann::json& j, const EndpointDetail& d);
void to_json(nlohmann::json& j, const SystemSummary& s);

}
