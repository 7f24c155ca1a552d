#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace tw::health { class Store; class Prober; }
namespace tw::traffic { class Table; }
namespace tw::scaling { class RuleSet; }
namespace tw::alert { class Log; }
namespace tw::stats::model { struct Metrics; }
namespace tw::provider { class Adapter; }

namespace tw::runtime {

using Clock = std::function<std::chrono::system_clock::time_point()>;

// Everything one engine instance owns. One per process, or one per test.
struct Context {
    std::shared_ptr<health::Store> store;
    std::shared_ptr<traffic::Table> trafficTable;
    std::shared_ptr<scaling::RuleSet> scalingRules;
    std::shared_ptr<alert::Log> alerts;
    std::shared_ptr<stats::model::Metrics> metrics;
    std::shared_ptr<provider::Adapter> adapter;
    std::shared_ptr<health::Prober> prober;
    Clock clock;
    std::chrono::system_clock::time_point startedAt;

    // Fresh collections around the given boundaries. A null clock means the system clock.
    static std::shared_ptr<Context> make(std::shared_ptr<health::Prober> prober,
                                         std::shared_ptr<provider::Adapter> adapter,
                                         Clock clock = nullptr);

    [[nodiscard]] std::chrono::system_clock::time_point now() const { return clock(); }
};

}
