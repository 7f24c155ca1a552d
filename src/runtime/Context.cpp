#include "runtime/Context.hpp"
#include "health/Store.hpp"
#include "health/Prober.hpp"
#include "traffic/Table.hpp"
#include "scaling/RuleSet.hpp"
#include "alert/Log.hpp"
#include "stats/model/Metrics.hpp"
#include "provider/Adapter.hpp"

#include <stdexcept>

using namespace tw::runtime;

std::shared_ptr<Context> Context::make(std::shared_ptr<health::Prober> prober,
                                       std::shared_ptr<provider::Adapter> adapter,
                                       Clock clock) {
    if (!prober) throw std::invalid_argument("Context requires a prober");
    if (!adapter) throw std::invalid_argument("Context requires a provider adapter");

    auto ctx = std::make_shared<Context>();
    ctx->store = std::make_shared<health::Store>();
    ctx->trafficTable = std::make_shared<traffic::Table>();
    ctx->scalingRules = std::make_shared<scaling::RuleSet>();
    ctx->alerts = std::make_shared<alert::Log>();
    ctx->metrics = std::make_shared<stats::model::Metrics>();
    ctx->adapter = std::move(adapter);
    ctx->prober = std::move(prober);
    ctx->clock = clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); });
    ctx->startedAt = ctx->clock();
    return ctx;
}
