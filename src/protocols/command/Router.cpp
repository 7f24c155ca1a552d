#include "protocols/command/Router.hpp"
#include "protocols/command/Parser.hpp"
#include "runtime/Controller.hpp"
#include "health/model/Monitor.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace tw::protocols::command;

namespace {

CommandResult ok(std::string out, nlohmann::json data) {
    return {0, std::move(out), "", std::move(data), true};
}

CommandResult fail(std::string err, nlohmann::json data = nullptr) {
    const bool hasData = !data.is_null();
    return {1, "", std::move(err), std::move(data), hasData};
}

template <class R>
CommandResult fromResult(const R& r) {
    nlohmann::json data = r;
    if (r.ok) return ok(r.message, std::move(data));
    return fail(r.message, std::move(data));
}

std::string renderEndpoint(const tw::stats::EndpointDetail& d) {
    return fmt::format("  {:<40} {:<16} uptime {:>6}  checks {}/{}  {}",
                       d.endpoint, tw::health::model::to_string(d.state), d.uptime,
                       d.success_count, d.success_count + d.failure_count,
                       d.response_time_ms ? fmt::format("{:.2f} ms", *d.response_time_ms)
                                          : d.last_error.value_or("-"));
}

}

Router::Router(std::shared_ptr<runtime::Controller> controller) : controller_(std::move(controller)) {}

CommandResult Router::executeLine(const std::string& line) const {
    const auto cmd = parse(line);
    log::Registry::shell()->debug("[Router] '{}' -> {}", line, name(cmd));
    return execute(cmd);
}

CommandResult Router::execute(const Command& cmd) const {
    try {
        return std::visit([this](const auto& c) { return handle(c); }, cmd);
    } catch (const std::exception& e) {
        log::Registry::shell()->error("[Router] {} failed: {}", name(cmd), e.what());
        return fail(fmt::format("Command failed: {}", e.what()));
    }
}

CommandResult Router::handle(const HealthCheck& c) const {
    return fromResult(controller_->registerEndpoint(c.endpoint, c.interval));
}

CommandResult Router::handle(const Unregister& c) const {
    return fromResult(controller_->unregisterEndpoint(c.endpoint));
}

CommandResult Router::handle(const RouteTraffic& c) const {
    return fromResult(controller_->addTrafficRule(c.source, c.target, c.weight));
}

CommandResult Router::handle(const AutoScale& c) const {
    return fromResult(controller_->addAutoScaleRule(c.metric, c.threshold, c.action));
}

CommandResult Router::handle(const Status& c) const {
    const auto status = controller_->getStatus(c.target);
    nlohmann::json data = status;
    if (!status.ok) return fail(status.message, std::move(data));

    std::string out;
    if (status.summary) {
        const auto& s = *status.summary;
        out += fmt::format("Overall: {} ({}/{} healthy), avg response {:.2f} ms\n",
                           s.overall_status, s.healthy_endpoints, s.total_endpoints, s.average_response_time_ms);
        out += fmt::format("Traffic rules: {}  Auto-scale rules: {}  Recent alerts: {}  Provider failures: {}\n",
                           s.traffic_rules, s.auto_scale_rules, s.recent_alerts, s.metrics.provider_failures);
        out += fmt::format("Monitoring: {}  Up: {}\n", s.monitoring_active ? "active" : "inactive", s.uptime);
    } else {
        out += status.message + "\n";
    }

    for (const auto& d : status.endpoints) out += renderEndpoint(d) + "\n";
    return ok(std::move(out), std::move(data));
}

CommandResult Router::handle(const Alerts&) const {
    const auto alerts = controller_->getAlerts();
    std::string out = fmt::format("{} alert(s) on record\n", alerts.total);
    for (const auto& a : alerts.alerts)
        out += fmt::format("  #{} {} {} failures={} failover={}{}\n",
                           a.id, a.endpoint, health::model::to_string(a.state), a.consecutive_failures,
                           a.failover_success ? "ok" : "failed",
                           a.failover_target ? " -> " + *a.failover_target : "");
    return ok(std::move(out), alerts);
}

CommandResult Router::handle(const Recommendations&) const {
    const auto recs = controller_->getRecommendations();
    std::string out;
    for (const auto& r : recs) out += "- " + r + "\n";
    return ok(std::move(out), {{"recommendations", recs}});
}

CommandResult Router::handle(const Endpoints&) const {
    const auto endpoints = controller_->getEndpoints();
    std::string out = fmt::format("{} endpoint(s)\n", endpoints.size());
    for (const auto& d : endpoints) out += renderEndpoint(d) + "\n";
    return ok(std::move(out), {{"endpoints", endpoints}, {"total", endpoints.size()}});
}

CommandResult Router::handle(const Metrics&) const {
    const auto m = controller_->getMetrics();
    nlohmann::json data = m;
    return ok(data.dump(2) + "\n", {{"metrics", data}});
}

CommandResult Router::handle(const Help&) const {
    return ok(helpText(), nullptr);
}

CommandResult Router::handle(const Clear&) const {
    return fromResult(controller_->clearAll());
}

CommandResult Router::handle(const Unknown& c) const {
    return fail(fmt::format("Unrecognised command: '{}'. Try 'help'.", c.line));
}

std::string Router::helpText() {
    return R"(Health checks:
  check health of <url> every <n> seconds|minutes
  monitor <url> health every <n>      ping <url> every <n>
  watch <url> health                  monitor <url>
  stop monitoring <url>
Traffic:
  route <src> to <dst> with <n>% traffic
  send <n>% of traffic from <src> to <dst>
  redirect <src> to <dst> [at <n>%]   failover <src> to <dst>
Scaling:
  scale up when cpu above <n>%        scale down when cpu below <n>%
  increase capacity when memory above <n>
Status:
  status of <target>   how is <target> doing   show status   dashboard
  alerts   recommendations   endpoints   metrics
  clear
)";
}
