#pragma once

#include "concurrency/AsyncService.hpp"
#include "concurrency/Task.hpp"
#include "health/model/Outcome.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace tw::runtime { struct Context; }
namespace tw::failover { class Coordinator; }
namespace tw::concurrency { class ThreadPool; }

namespace tw::health {

class Prober;

// Runs one probe on a pool worker and hands the outcome back through the future.
struct ProbeTask final : concurrency::PromisedTask<model::Outcome> {
    ProbeTask(std::shared_ptr<Prober> prober, std::string endpoint, std::chrono::milliseconds timeout);

    void operator()() override;

private:
    std::shared_ptr<Prober> prober_;
    std::string endpoint_;
    std::chrono::milliseconds timeout_;
};

struct TickReport {
    size_t due{};
    size_t applied{};
    size_t escalated{};
};

class MonitorService final : public concurrency::AsyncService {
public:
    struct Options {
        std::chrono::milliseconds tick_interval = std::chrono::seconds(2);
        std::chrono::milliseconds idle_interval = std::chrono::seconds(5);
        unsigned int probe_workers = 4;   // 0 = probe on the loop thread
    };

    MonitorService(std::shared_ptr<runtime::Context> ctx,
                   std::shared_ptr<failover::Coordinator> coordinator,
                   Options options);

    ~MonitorService() override;

    // One pass: probe every due endpoint, fold the outcomes in, execute effects.
    TickReport tick();

    [[nodiscard]] const Options& options() const { return options_; }

protected:
    void runLoop() override;
    void onStop() override;

private:
    std::shared_ptr<runtime::Context> ctx_;
    std::shared_ptr<failover::Coordinator> coordinator_;
    Options options_;
    std::unique_ptr<concurrency::ThreadPool> pool_;

    std::mutex waitMutex_;
    std::condition_variable waitCv_;

    model::Outcome probeNow(const std::string& endpoint, std::chrono::milliseconds timeout) const;
};

}
