#include "runtime/Controller.hpp"
#include "runtime/Context.hpp"
#include "config/Config.hpp"
#include "failover/Coordinator.hpp"
#include "health/Store.hpp"
#include "traffic/Table.hpp"
#include "scaling/RuleSet.hpp"
#include "alert/Log.hpp"
#include "provider/Adapter.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/Task.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace tw::runtime;
using namespace tw::health::model;

namespace {

std::string trim(const std::string& s) {
    const auto first = std::ranges::find_if_not(s, [](const unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(s.rbegin(), s.rend(), [](const unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string{};
}

std::optional<std::string> validateCheckConfig(const CheckConfig& c) {
    if (c.poll_interval.count() <= 0) return "Interval must be positive";
    if (c.poll_interval > Controller::MAX_INTERVAL)
        return fmt::format("Interval must not exceed {} seconds", Controller::MAX_INTERVAL.count());
    if (c.timeout.count() <= 0) return "Timeout must be positive";
    if (c.failure_threshold < 1) return "Failure threshold must be at least 1";
    if (c.expected_status < 100 || c.expected_status > 599) return fmt::format("Expected status {} is not an HTTP status", c.expected_status);
    return std::nullopt;
}

// One adapter call. Failures stay inside the task.
class IntentTask final : public tw::concurrency::Task {
public:
    IntentTask(std::shared_ptr<Context> ctx, std::string what, std::function<void(tw::provider::Adapter&)> deliver)
        : ctx_(std::move(ctx)), what_(std::move(what)), deliver_(std::move(deliver)) {}

    void operator()() override {
        try {
            deliver_(*ctx_->adapter);
            tw::log::Registry::provider()->debug("[Controller] Delivered {}", what_);
        } catch (const std::exception& e) {
            ++ctx_->metrics->provider_failures;
            tw::log::Registry::provider()->error("[Controller] Provider rejected {}: {}", what_, e.what());
        }
    }

private:
    std::shared_ptr<Context> ctx_;
    std::string what_;
    std::function<void(tw::provider::Adapter&)> deliver_;
};

template <class R>
R rejected(std::string message) {
    R r;
    r.ok = false;
    r.message = std::move(message);
    return r;
}

}

Controller::Options Controller::optionsFrom(const config::Config& cnf) {
    Options o;
    o.monitor.tick_interval = cnf.monitor.tick_interval;
    o.monitor.idle_interval = cnf.monitor.idle_interval;
    o.monitor.probe_workers = cnf.monitor.probe_workers;
    o.provider_workers = cnf.provider.workers;
    o.defaults.expected_status = cnf.health_check_defaults.expected_status;
    o.defaults.timeout = cnf.health_check_defaults.timeout;
    o.defaults.poll_interval = cnf.health_check_defaults.interval;
    o.defaults.failure_threshold = cnf.health_check_defaults.failure_threshold;
    return o;
}

Controller::Controller(std::shared_ptr<Context> ctx, Options options)
    : ctx_(std::move(ctx)),
      options_(options),
      coordinator_(std::make_shared<failover::Coordinator>(ctx_)),
      monitor_(std::make_unique<health::MonitorService>(ctx_, coordinator_, options_.monitor)),
      aggregator_(ctx_) {
    if (options_.provider_workers > 0)
        providerPool_ = std::make_unique<concurrency::ThreadPool>("provider", options_.provider_workers);
}

Controller::~Controller() {
    stopMonitoring();
    if (providerPool_) {
        if (const auto pending = providerPool_->queueDepth())
            log::Registry::provider()->warn("[Controller] Dropping {} undelivered provider intent(s)", pending);
        providerPool_->stop();
    }
}

void Controller::dispatchIntent(std::string what, std::function<void(provider::Adapter&)> deliver) {
    const auto task = std::make_shared<IntentTask>(ctx_, std::move(what), std::move(deliver));
    if (providerPool_) providerPool_->submit(task);
    else (*task)();
}

std::optional<std::string> Controller::normalizeEndpoint(const std::string& url, std::string& error) {
    auto s = trim(url);
    if (s.empty()) {
        error = "Endpoint must not be empty";
        return std::nullopt;
    }

    if (std::ranges::any_of(s, [](const unsigned char c) { return std::isspace(c); })) {
        error = fmt::format("Endpoint '{}' contains whitespace", s);
        return std::nullopt;
    }

    auto schemeEnd = s.find("://");
    if (schemeEnd == std::string::npos) {
        s = "https://" + s;
        schemeEnd = 5;
    }

    std::string scheme = s.substr(0, schemeEnd);
    std::ranges::transform(scheme, scheme.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http" && scheme != "https") {
        error = fmt::format("Unsupported scheme '{}' (expected http or https)", scheme);
        return std::nullopt;
    }

    const auto rest = s.substr(schemeEnd + 3);
    auto authority = rest.substr(0, rest.find_first_of("/?#"));
    if (const auto at = authority.rfind('@'); at != std::string::npos) authority = authority.substr(at + 1);
    const auto host = authority.starts_with('[') ? authority.substr(0, authority.find(']') + 1)
                                                 : authority.substr(0, authority.find(':'));
    if (host.empty()) {
        error = fmt::format("Endpoint '{}' has no host", s);
        return std::nullopt;
    }

    return scheme + "://" + rest;
}

RegistrationResult Controller::registerEndpoint(const std::string& url, const std::chrono::seconds interval) {
    if (interval.count() <= 0) return rejected<RegistrationResult>("Interval must be positive");
    if (interval > MAX_INTERVAL)
        return rejected<RegistrationResult>(fmt::format("Interval must not exceed {} seconds", MAX_INTERVAL.count()));

    auto cnf = options_.defaults;
    cnf.poll_interval = interval;
    return registerEndpoint(url, cnf);
}

RegistrationResult Controller::registerEndpoint(const std::string& url, const CheckConfig& config) {
    std::string error;
    const auto endpoint = normalizeEndpoint(url, error);
    if (!endpoint) return rejected<RegistrationResult>(error);
    if (const auto invalid = validateCheckConfig(config)) return rejected<RegistrationResult>(*invalid);

    const auto reg = ctx_->store->upsert(*endpoint, config, ctx_->now());
    ++ctx_->metrics->total_requests;

    if (options_.auto_start_monitor) startMonitoring();

    const auto intervalSeconds = std::chrono::duration_cast<std::chrono::seconds>(config.poll_interval);
    log::Registry::trafficwarden()->info("[Controller] {} health check for {} every {}s",
                                         reg.replaced ? "Replaced" : "Configured", *endpoint, intervalSeconds.count());
    log::Registry::audit()->info("register endpoint={} interval={}s timeout={}ms expected_status={} threshold={}",
                                 *endpoint, intervalSeconds.count(), config.timeout.count(),
                                 config.expected_status, config.failure_threshold);

    RegistrationResult r;
    r.ok = true;
    r.message = fmt::format("Health check configured for {}", *endpoint);
    r.endpoint = *endpoint;
    r.interval = intervalSeconds;
    r.monitoring_active = monitoringActive();
    return r;
}

OperationResult Controller::unregisterEndpoint(const std::string& url) {
    std::string error;
    const auto endpoint = normalizeEndpoint(url, error);
    if (!endpoint) return {false, error};

    if (!ctx_->store->remove(*endpoint))
        return {false, fmt::format("No health check registered for {}", *endpoint)};

    ++ctx_->metrics->total_requests;
    log::Registry::trafficwarden()->info("[Controller] Removed health check for {}", *endpoint);
    log::Registry::audit()->info("unregister endpoint={}", *endpoint);
    return {true, fmt::format("Health check removed for {}", *endpoint)};
}

TrafficRuleResult Controller::addTrafficRule(const std::string& source, const std::string& target,
                                             const long long weight, const std::optional<std::string>& condition) {
    const auto src = trim(source), dst = trim(target);
    if (src.empty()) return rejected<TrafficRuleResult>("Traffic rule source must not be empty");
    if (dst.empty()) return rejected<TrafficRuleResult>("Traffic rule target must not be empty");

    const auto rule = ctx_->trafficTable->add(src, dst, weight, condition);
    ++ctx_->metrics->traffic_routes_created;
    ++ctx_->metrics->total_requests;

    log::Registry::traffic()->info("[Controller] Rule #{}: {}% from {} to {}", rule.id, rule.weight, src, dst);
    log::Registry::audit()->info("traffic_rule id={} source={} target={} weight={}", rule.id, src, dst, rule.weight);

    dispatchIntent(fmt::format("traffic rule #{}", rule.id),
                   [rule](provider::Adapter& a) { a.applyTrafficRule(rule); });

    TrafficRuleResult r;
    r.rule_id = rule.id;
    r.rule = rule;
    r.ok = true;
    r.message = fmt::format("Traffic routing configured: {}% from {} to {}", rule.weight, src, dst);
    return r;
}

AutoScaleRuleResult Controller::addAutoScaleRule(const std::string& metric, const double threshold,
                                                 const std::string& action) {
    scaling::model::Metric m;
    scaling::model::Action a;
    try {
        m = scaling::model::metricFromString(trim(metric));
        a = scaling::model::actionFromString(trim(action));
    } catch (const std::invalid_argument& e) {
        return rejected<AutoScaleRuleResult>(e.what());
    }
    return addAutoScaleRule(m, threshold, a);
}

AutoScaleRuleResult Controller::addAutoScaleRule(const scaling::model::Metric metric, const double threshold,
                                                 const scaling::model::Action action) {
    if (!std::isfinite(threshold) || threshold < 0.0)
        return rejected<AutoScaleRuleResult>(fmt::format("Threshold {} must be a finite, non-negative number", threshold));

    const auto rule = ctx_->scalingRules->add(metric, threshold, action);
    ++ctx_->metrics->auto_scale_triggers;
    ++ctx_->metrics->total_requests;

    const auto metricName = scaling::model::to_string(metric);
    const auto actionName = scaling::model::to_string(action);
    log::Registry::scaling()->info("[Controller] Rule #{}: {} when {} reaches {}", rule.id, actionName, metricName, threshold);
    log::Registry::audit()->info("autoscale_rule id={} metric={} threshold={} action={}", rule.id, metricName, threshold, actionName);

    dispatchIntent(fmt::format("alarm {}", provider::alarmName(rule, rule.id)),
                   [rule](provider::Adapter& a) { a.createScalingAlarm(rule, rule.id); });

    AutoScaleRuleResult r;
    r.rule_id = rule.id;
    r.rule = rule;
    r.ok = true;
    r.message = fmt::format("Auto-scaling configured: {} when {} reaches {}%", actionName, metricName, threshold);
    return r;
}

StatusResult Controller::getStatus(const std::optional<std::string>& target) const {
    StatusResult r;
    r.timestamp = util::timestampToString(ctx_->now());

    if (!target || trim(*target).empty()) {
        r.ok = true;
        r.message = "System status";
        r.summary = aggregator_.summary(monitoringActive());
        r.endpoints = aggregator_.endpoints();
        return r;
    }

    const auto needle = trim(*target);
    r.target = needle;
    r.endpoints = aggregator_.endpoints(needle);
    if (r.endpoints.empty()) {
        r.ok = false;
        r.message = fmt::format("No endpoints found matching \"{}\"", needle);
        return r;
    }

    r.ok = true;
    r.message = fmt::format("{} endpoint(s) matching \"{}\"", r.endpoints.size(), needle);
    return r;
}

std::vector<std::string> Controller::getRecommendations() const {
    return aggregator_.recommendations(monitoringActive());
}

AlertsResult Controller::getAlerts(const std::size_t limit) const {
    return {
        .alerts = ctx_->alerts->recent(limit),
        .total = ctx_->alerts->size(),
        .timestamp = util::timestampToString(ctx_->now())
    };
}

std::vector<tw::stats::EndpointDetail> Controller::getEndpoints() const {
    return aggregator_.endpoints();
}

tw::stats::model::MetricsSnapshot Controller::getMetrics() const {
    return ctx_->metrics->snapshot();
}

HealthInfo Controller::health() const {
    HealthInfo h;
    h.version = VERSION;
    h.mode = ctx_->adapter->live() ? "live" : "simulated";
    h.timestamp = util::timestampToString(ctx_->now());
    return h;
}

OperationResult Controller::clearAll() {
    ctx_->store->clear();
    ctx_->trafficTable->clear();
    ctx_->scalingRules->clear();
    ctx_->alerts->clear();
    ctx_->metrics->reset();

    log::Registry::trafficwarden()->info("[Controller] All configuration cleared");
    log::Registry::audit()->info("clear_all");
    return {true, "All configurations cleared and system reset"};
}

void Controller::startMonitoring() {
    std::scoped_lock lock(lifecycleMutex_);
    if (!monitor_->isRunning()) monitor_->start();
}

void Controller::stopMonitoring() {
    std::scoped_lock lock(lifecycleMutex_);
    monitor_->stop();
}

bool Controller::monitoringActive() const {
    return monitor_->isRunning();
}

tw::health::TickReport Controller::tick() {
    return monitor_->tick();
}

void tw::runtime::to_json(nlohmann::json& j, const OperationResult& r) {
    j = {
        {"status", r.ok ? "success" : "error"},
        {"message", r.message}
    };
}

void tw::runtime::to_json(nlohmann::json& j, const RegistrationResult& r) {
    to_json(j, static_cast<const OperationResult&>(r));
    if (!r.ok) return;
    j["endpoint"] = r.endpoint;
    j["interval"] = r.interval.count();
    j["monitoring_active"] = r.monitoring_active;
}

void tw::runtime::to_json(nlohmann::json& j, const TrafficRuleResult& r) {
    to_json(j, static_cast<const OperationResult&>(r));
    if (!r.rule) return;
    j["rule_id"] = r.rule_id;
    j["rule"] = *r.rule;
}

void tw::runtime::to_json(nlohmann::json& j, const AutoScaleRuleResult& r) {
    to_json(j, static_cast<const OperationResult&>(r));
    if (!r.rule) return;
    j["rule_id"] = r.rule_id;
    j["rule"] = *r.rule;
}

void tw::runtime::to_json(nlohmann::json& j, const StatusResult& r) {
    to_json(j, static_cast<const OperationResult&>(r));
    j["timestamp"] = r.timestamp;
    if (r.summary) j["summary"] = *r.summary;
    if (r.target) {
        j["target"] = *r.target;
        j["matches"] = r.endpoints.size();
    }
    j["endpoints"] = r.endpoints;
}

void tw::runtime::to_json(nlohmann::json& j, const AlertsResult& r) {
    j = {
        {"alerts", r.alerts},
        {"total_alerts", r.total},
        {"timestamp", r.timestamp}
    };
}

void tw::runtime::to_json(nlohmann::json& j, const HealthInfo& h) {
    j = {
        {"status", h.status},
        {"service", h.service},
        {"version", h.version},
        {"mode", h.mode},
        {"timestamp", h.timestamp}
    };
}
