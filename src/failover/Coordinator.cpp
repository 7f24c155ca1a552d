#include "failover/Coordinator.hpp"
#include "runtime/Context.hpp"
#include "health/Store.hpp"
#include "alert/Log.hpp"
#include "provider/Adapter.hpp"
#include "log/Registry.hpp"

using namespace tw::failover;
using namespace tw::health::model;

Coordinator::Coordinator(std::shared_ptr<runtime::Context> ctx) : ctx_(std::move(ctx)) {}

Decision Coordinator::failover(const std::string& failedEndpoint) const {
    std::optional<std::string> target;
    for (const auto& m : ctx_->store->snapshot()) {
        if (m.endpoint != failedEndpoint && m.state == State::Healthy) {
            target = m.endpoint;
            break;
        }
    }

    if (!target) {
        log::Registry::failover()->error("[Coordinator] No healthy endpoint to take over from {}", failedEndpoint);
        return {};
    }

    try {
        ctx_->adapter->applyTrafficShift({.from = failedEndpoint, .to = *target, .weight = 100});
    } catch (const std::exception& e) {
        log::Registry::provider()->error("[Coordinator] Traffic shift {} -> {} failed: {}",
                                         failedEndpoint, *target, e.what());
        return {.success = false, .target = target};
    }

    log::Registry::failover()->info("[Coordinator] Traffic shifted from {} to {}", failedEndpoint, *target);
    return {.success = true, .target = target};
}

tw::alert::model::Alert Coordinator::escalate(const std::string& endpoint) const {
    const auto decision = failover(endpoint);

    alert::model::Alert a;
    a.timestamp = ctx_->now();
    a.endpoint = endpoint;
    a.failover_success = decision.success;
    a.failover_target = decision.target;

    if (const auto m = ctx_->store->get(endpoint)) {
        a.state = m->state;
        a.consecutive_failures = m->consecutive_failures;
        a.last_error = m->last_error;
    }

    a = ctx_->alerts->append(std::move(a));

    log::Registry::alerts()->warn("[Coordinator] Alert #{} {} is {} after {} failures ({}), failover {}",
                                  a.id, a.endpoint, to_string(a.state), a.consecutive_failures,
                                  a.last_error.value_or("no error recorded"),
                                  a.failover_success ? "succeeded" : "failed");
    return a;
}
