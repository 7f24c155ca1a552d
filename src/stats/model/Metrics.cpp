#include "stats/model/Metrics.hpp"

#include <nlohmann/json.hpp>

using namespace tw::stats::model;

MetricsSnapshot Metrics::snapshot() const {
    return {
        .total_requests = total_requests.load(),
        .successful_health_checks = successful_health_checks.load(),
        .failed_health_checks = failed_health_checks.load(),
        .traffic_routes_created = traffic_routes_created.load(),
        .auto_scale_triggers = auto_scale_triggers.load(),
        .provider_failures = provider_failures.load()
    };
}

void Metrics::reset() {
    successful_health_checks.store(0);
    failed_health_checks.store(0);
    traffic_routes_created.store(0);
    auto_scale_triggers.store(0);
    provider_failures.store(0);
    ++total_requests;
}

void tw::stats::model::to_json(nlohmann::json& j, const MetricsSnapshot& m) {
    j = {
        {"total_requests", m.total_requests},
        {"successful_health_checks", m.successful_health_checks},
        {"failed_health_checks", m.failed_health_checks},
        {"traffic_routes_created", m.traffic_routes_created},
        {"auto_scale_triggers", m.auto_scale_triggers},
        {"provider_failures", m.provider_failures}
    };
}
