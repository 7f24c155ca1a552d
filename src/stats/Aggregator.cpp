#include "stats/Aggregator.hpp"
#include "runtime/Context.hpp"
#include "health/Store.hpp"
#include "traffic/Table.hpp"
#include "scaling/RuleSet.hpp"
#include "alert/Log.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

using namespace tw::stats;
using namespace tw::health::model;

namespace {

constexpr auto RECENT_ALERT_WINDOW = std::chrono::hours(1);

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

nlohmann::json optionalJson(const auto& opt) {
    return opt ? nlohmann::json(*opt) : nlohmann::json(nullptr);
}

}

Aggregator::Aggregator(std::shared_ptr<runtime::Context> ctx) : ctx_(std::move(ctx)) {}

std::string Aggregator::uptime(const uint64_t successes, const uint64_t failures) {
    const auto total = successes + failures;
    if (total == 0) return "N/A";
    return fmt::format("{:.1f}%", static_cast<double>(successes) / static_cast<double>(total) * 100.0);
}

std::string Aggregator::overallStatus(const std::vector<Monitor>& monitors) {
    if (monitors.empty()) return "degraded";
    const bool allHealthy = std::ranges::all_of(monitors, [](const Monitor& m) { return m.state == State::Healthy; });
    return allHealthy ? "healthy" : "degraded";
}

double Aggregator::averageResponseTime(const std::vector<Monitor>& monitors) {
    double sum = 0.0;
    size_t n = 0;
    for (const auto& m : monitors) {
        if (m.state != State::Healthy || !m.last_response_time_ms) continue;
        sum += *m.last_response_time_ms;
        ++n;
    }
    if (n == 0) return 0.0;
    return std::round(sum / static_cast<double>(n) * 100.0) / 100.0;
}

EndpointDetail Aggregator::detail(const Monitor& m) {
    return {
        .endpoint = m.endpoint,
        .state = m.state,
        .uptime = uptime(m.success_count, m.failure_count),
        .success_count = m.success_count,
        .failure_count = m.failure_count,
        .consecutive_failures = m.consecutive_failures,
        .last_check = util::timestampToString(m.last_probe_at),
        .response_time_ms = m.last_response_time_ms,
        .last_error = m.last_error,
        .config = m.config,
        .created_at = util::timestampToString(m.created_at)
    };
}

std::vector<EndpointDetail> Aggregator::endpoints(const std::string& filter) const {
    const auto needle = lower(filter);
    std::vector<EndpointDetail> out;
    for (const auto& m : ctx_->store->snapshot())
        if (needle.empty() || lower(m.endpoint).find(needle) != std::string::npos)
            out.push_back(detail(m));
    return out;
}

size_t Aggregator::recentAlertCount() const {
    return ctx_->alerts->countSince(ctx_->now() - RECENT_ALERT_WINDOW);
}

SystemSummary Aggregator::summary(const bool monitoringActive) const {
    const auto monitors = ctx_->store->snapshot();
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(ctx_->now() - ctx_->startedAt);

    return {
        .overall_status = overallStatus(monitors),
        .total_endpoints = monitors.size(),
        .healthy_endpoints = static_cast<size_t>(std::ranges::count_if(monitors, [](const Monitor& m) {
            return m.state == State::Healthy;
        })),
        .traffic_rules = ctx_->trafficTable->size(),
        .auto_scale_rules = ctx_->scalingRules->size(),
        .recent_alerts = recentAlertCount(),
        .average_response_time_ms = averageResponseTime(monitors),
        .monitoring_active = monitoringActive,
        .uptime = formatDuration(std::max(elapsed, std::chrono::seconds(0))),
        .metrics = ctx_->metrics->snapshot()
    };
}

std::vector<std::string> Aggregator::recommendations(const bool monitoringActive) const {
    const auto monitors = ctx_->store->snapshot();
    std::vector<std::string> out;

    std::vector<std::string> unhealthy;
    for (const auto& m : monitors)
        if (m.state != State::Healthy && m.state != State::Initializing) unhealthy.push_back(m.endpoint);

    if (!unhealthy.empty()) {
        std::string names = unhealthy[0];
        if (unhealthy.size() > 1) names += ", " + unhealthy[1];
        if (unhealthy.size() > 2) names += fmt::format(" and {} more", unhealthy.size() - 2);
        out.push_back(fmt::format("Investigate {} unhealthy endpoint(s): {}", unhealthy.size(), names));
    }

    if (const auto recent = recentAlertCount(); recent > 0)
        out.push_back(fmt::format("Review {} alert(s) raised in the last hour", recent));

    if (monitors.size() < 2)
        out.push_back("Register at least two endpoints so failover has a target");

    if (ctx_->trafficTable->size() == 0 && monitors.size() > 1)
        out.push_back("Add traffic routing rules to balance load across endpoints");

    if (ctx_->scalingRules->size() == 0)
        out.push_back("Configure auto-scaling rules to absorb load spikes");

    std::vector<std::string> slow;
    for (const auto& m : monitors)
        if (m.state == State::Healthy && m.last_response_time_ms && *m.last_response_time_ms > SLOW_RESPONSE_MS)
            slow.push_back(m.endpoint);
    if (!slow.empty())
        out.push_back(fmt::format("Optimise slow endpoint(s) responding above {:.0f} ms: {}",
                                  SLOW_RESPONSE_MS, fmt::join(slow, ", ")));

    if (!monitoringActive && !monitors.empty())
        out.push_back("Start health monitoring; endpoints are registered but not being probed");

    if (const auto failed = ctx_->metrics->provider_failures.load(); failed > 0)
        out.push_back(fmt::format("Check the provider integration; {} intent(s) could not be delivered", failed));

    if (out.empty()) out.emplace_back("System is running optimally");
    return out;
}

std::string tw::stats::formatDuration(const std::chrono::seconds d) {
    const auto h = std::chrono::duration_cast<std::chrono::hours>(d);
    const auto m = std::chrono::duration_cast<std::chrono::minutes>(d - h);
    const auto s = d - h - m;
    return fmt::format("{}h {}m {}s", h.count(), m.count(), s.count());
}

void tw::stats::to_json(nlohmann::json& j, const EndpointDetail& d) {
    j = {
        {"endpoint", d.endpoint},
        {"status", to_string(d.state)},
        {"uptime", d.uptime},
        {"success_count", d.success_count},
        {"failure_count", d.failure_count},
        {"failures", d.consecutive_failures},
        {"consecutive_failures", d.consecutive_failures},
        {"last_check", optionalJson(d.last_check)},
        {"response_time_ms", optionalJson(d.response_time_ms)},
        {"last_error", optionalJson(d.last_error)},
        {"config", d.config},
        {"created_at", d.created_at}
    };
}

void tw::stats::to_json(nlohmann::json& j, const SystemSummary& s) {
    j = {
        {"overall_status", s.overall_status},
        {"total_endpoints", s.total_endpoints},
        {"healthy_endpoints", s.healthy_endpoints},
        {"traffic_rules", s.traffic_rules},
        {"auto_scale_rules", s.auto_scale_rules},
        {"recent_alerts", s.recent_alerts},
        {"average_response_time_ms", s.average_response_time_ms},
        {"monitoring_active", s.monitoring_active},
        {"uptime", s.uptime},
        {"metrics", s.metrics}
    };
}
