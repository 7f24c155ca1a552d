#include "health/MonitorService.hpp"
#include "health/Prober.hpp"
#include "health/Store.hpp"
#include "concurrency/ThreadPool.hpp"
#include "failover/Coordinator.hpp"
#include "runtime/Context.hpp"
#include "stats/model/Metrics.hpp"
#include "log/Registry.hpp"

#include <future>
#include <utility>
#include <vector>

using namespace tw::health;
using namespace tw::health::model;
using namespace tw::concurrency;

ProbeTask::ProbeTask(std::shared_ptr<Prober> prober, std::string endpoint, const std::chrono::milliseconds timeout)
    : prober_(std::move(prober)), endpoint_(std::move(endpoint)), timeout_(timeout) {}

void ProbeTask::operator()() {
    try {
        promise.set_value(prober_->probe(endpoint_, timeout_));
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

MonitorService::MonitorService(std::shared_ptr<runtime::Context> ctx,
                               std::shared_ptr<failover::Coordinator> coordinator,
                               Options options)
    : AsyncService("MonitorService"),
      ctx_(std::move(ctx)),
      coordinator_(std::move(coordinator)),
      options_(options) {
    if (options_.probe_workers > 0)
        pool_ = std::make_unique<ThreadPool>("probe", options_.probe_workers);
}

MonitorService::~MonitorService() {
    stop();
    if (pool_) pool_->stop();
}

Outcome MonitorService::probeNow(const std::string& endpoint, const std::chrono::milliseconds timeout) const {
    try {
        return ctx_->prober->probe(endpoint, timeout);
    } catch (const std::exception& e) {
        return outcome::OtherError{e.what()};
    }
}

TickReport MonitorService::tick() {
    TickReport report;
    const auto now = ctx_->now();

    std::vector<Monitor> due;
    for (auto& m : ctx_->store->snapshot())
        if (m.isDue(now)) due.push_back(std::move(m));

    report.due = due.size();
    if (due.empty()) return report;

    log::Registry::monitor()->debug("[MonitorService] Probing {} due endpoint(s)", due.size());

    std::vector<Outcome> outcomes;
    outcomes.reserve(due.size());

    if (pool_) {
        std::vector<std::future<Outcome>> futures;
        futures.reserve(due.size());
        for (const auto& m : due) {
            auto task = std::make_shared<ProbeTask>(ctx_->prober, m.endpoint, m.config.timeout);
            futures.push_back(task->getFuture());
            pool_->submit(task);
        }

        for (auto& f : futures) {
            try {
                outcomes.push_back(f.get());
            } catch (const std::exception& e) {
                outcomes.emplace_back(outcome::OtherError{e.what()});
            }
        }
    } else {
        for (const auto& m : due) outcomes.push_back(probeNow(m.endpoint, m.config.timeout));
    }

    // Results are folded in with the clock read after probing, as the probe finished then.
    const auto completedAt = ctx_->now();

    for (size_t i = 0; i < due.size(); ++i) {
        const auto& m = due[i];
        try {
            const auto t = ctx_->store->apply(m.endpoint, m.generation, outcomes[i], completedAt);
            if (!t) {
                log::Registry::monitor()->debug("[MonitorService] Dropping stale result for {}", m.endpoint);
                continue;
            }

            ++report.applied;
            if (t->success) ++ctx_->metrics->successful_health_checks;
            else ++ctx_->metrics->failed_health_checks;

            if (!t->success)
                log::Registry::probe()->warn("[MonitorService] {} -> {} ({}/{}): {}",
                                             m.endpoint, to_string(t->monitor.state),
                                             t->monitor.consecutive_failures, t->monitor.config.failure_threshold,
                                             describe(outcomes[i]));

            if (t->escalates()) {
                coordinator_->escalate(m.endpoint);
                ++report.escalated;
            }
        } catch (const std::exception& e) {
            log::Registry::monitor()->error("[MonitorService] Failed to process {}: {}", m.endpoint, e.what());
        }
    }

    return report;
}

void MonitorService::runLoop() {
    log::Registry::monitor()->info("[MonitorService] Monitoring loop started");

    while (!interruptFlag_.load(std::memory_order_acquire)) {
        try {
            tick();
        } catch (const std::exception& e) {
            log::Registry::monitor()->error("[MonitorService] Tick failed: {}", e.what());
        }

        const auto wait = ctx_->store->empty() ? options_.idle_interval : options_.tick_interval;
        std::unique_lock lock(waitMutex_);
        waitCv_.wait_for(lock, wait, [this] { return interruptFlag_.load(std::memory_order_acquire); });
    }

    log::Registry::monitor()->info("[MonitorService] Monitoring loop stopped");
}

void MonitorService::onStop() {
    std::scoped_lock lock(waitMutex_);
    waitCv_.notify_all();
}
