#pragma once

#include "health/MonitorService.hpp"
#include "health/model/Monitor.hpp"
#include "traffic/model/Rule.hpp"
#include "scaling/model/Rule.hpp"
#include "alert/model/Alert.hpp"
#include "stats/Aggregator.hpp"
#include "stats/model/Metrics.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace tw::config { struct Config; }
namespace tw::failover { class Coordinator; }
namespace tw::concurrency { class ThreadPool; }
namespace tw::provider { class Adapter; }

namespace tw::runtime {

struct Context;

struct OperationResult {
    bool ok = false;
    std::string message;
};

struct RegistrationResult : OperationResult {
    std::string endpoint;
    std::chrono::seconds interval{};
    bool monitoring_active = false;
};

struct TrafficRuleResult : OperationResult {
    std::size_t rule_id{};
    std::optional<traffic::model::Rule> rule;
};

struct AutoScaleRuleResult : OperationResult {
    std::size_t rule_id{};
    std::optional<scaling::model::Rule> rule;
};

// Either the system summary (no target) or the endpoints matching the target.
struct StatusResult : OperationResult {
    std::optional<std::string> target;
    std::optional<stats::SystemSummary> summary;
    std::vector<stats::EndpointDetail> endpoints;
    std::string timestamp;
};

struct AlertsResult {
    std::vector<alert::model::Alert> alerts;
    std::size_t total{};
    std::string timestamp;
};

struct HealthInfo {
    std::string status = "healthy";
    std::string service = "trafficwarden";
    std::string version;
    std::string mode;      // "live" or "simulated"
    std::string timestamp;
};

// The surface every front end talks to. Configuration errors come back as ok=false,
// never as exceptions. Provider intents are queued and delivered off the caller's
// thread; a failed delivery is logged and counted in provider_failures.
class Controller {
public:
    static constexpr auto VERSION = "2.0";
    static constexpr std::size_t DEFAULT_ALERT_LIMIT = 50;
    static constexpr std::chrono::seconds MAX_INTERVAL = std::chrono::hours(24);

    struct Options {
        health::MonitorService::Options monitor;
        health::model::CheckConfig defaults;
        bool auto_start_monitor = true;   // start the loop on the first registration
        unsigned int provider_workers = 1;  // 0 = deliver adapter intents on the caller's thread
    };

    static Options optionsFrom(const config::Config& cnf);

    Controller(std::shared_ptr<Context> ctx, Options options);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    RegistrationResult registerEndpoint(const std::string& url, std::chrono::seconds interval);
    RegistrationResult registerEndpoint(const std::string& url, const health::model::CheckConfig& config);
    OperationResult unregisterEndpoint(const std::string& url);

    TrafficRuleResult addTrafficRule(const std::string& source, const std::string& target, long long weight = 100,
                                     const std::optional<std::string>& condition = std::nullopt);

    AutoScaleRuleResult addAutoScaleRule(const std::string& metric, double threshold, const std::string& action);
    AutoScaleRuleResult addAutoScaleRule(scaling::model::Metric metric, double threshold, scaling::model::Action action);

    [[nodiscard]] StatusResult getStatus(const std::optional<std::string>& target = std::nullopt) const;
    [[nodiscard]] std::vector<std::string> getRecommendations() const;
    [[nodiscard]] AlertsResult getAlerts(std::size_t limit = DEFAULT_ALERT_LIMIT) const;
    [[nodiscard]] std::vector<stats::EndpointDetail> getEndpoints() const;
    [[nodiscard]] stats::model::MetricsSnapshot getMetrics() const;
    [[nodiscard]] HealthInfo health() const;

    OperationResult clearAll();

    void startMonitoring();
    void stopMonitoring();
    [[nodiscard]] bool monitoringActive() const;

    // Drives one monitor pass on the caller's thread.
    health::TickReport tick();

    [[nodiscard]] const Options& options() const { return options_; }
    [[nodiscard]] const std::shared_ptr<Context>& context() const { return ctx_; }

    // Adds a scheme when missing and rejects anything that is not a plain http(s) URL.
    // Returns nullopt and fills `error` on rejection.
    static std::optional<std::string> normalizeEndpoint(const std::string& url, std::string& error);

private:
    std::shared_ptr<Context> ctx_;
    Options options_;
    std::shared_ptr<failover::Coordinator> coordinator_;
    std::unique_ptr<health::MonitorService> monitor_;
    std::unique_ptr<concurrency::ThreadPool> providerPool_;
    stats::Aggregator aggregator_;

    void dispatchIntent(std::string what, std::function<void(provider::Adapter&)> deliver);

    mutable std::mutex lifecycleMutex_;
};

void to_json(nlohmann::json& j, const OperationResult& r);
void to_json(nlohmann::json& j, const RegistrationResult& r);
void to_json(nlohmann::json& j, const TrafficRuleResult& r);
void to_json(nlohmann::json& j, const AutoScaleRuleResult& r);
void to_json(nlohmann::json& j, const StatusResult& r);
void to_json(nlohmann::json& j, const AlertsResult& r);
void to_json(nlohmann::json& j, const HealthInfo& h);

}
