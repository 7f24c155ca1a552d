#include <gtest/gtest.h>

#include "fakes.hpp"
#include "stats/Aggregator.hpp"
#include "health/Store.hpp"
#include "traffic/Table.hpp"
#include "scaling/RuleSet.hpp"
#include "alert/Log.hpp"
#include "runtime/Context.hpp"

#include <nlohmann/json.hpp>

using namespace tw;
using namespace tw::health::model;
using namespace std::chrono_literals;

TEST(AggregatorStaticTest, Uptime) {
    EXPECT_EQ(stats::Aggregator::uptime(0, 0), "N/A");
    EXPECT_EQ(stats::Aggregator::uptime(1, 0), "100.0%");
    EXPECT_EQ(stats::Aggregator::uptime(2, 1), "66.7%");
    EXPECT_EQ(stats::Aggregator::uptime(0, 4), "0.0%");
}

TEST(AggregatorStaticTest, FormatDuration) {
    EXPECT_EQ(stats::formatDuration(0s), "0h 0m 0s");
    EXPECT_EQ(stats::formatDuration(3h + 12min + 5s), "3h 12m 5s");
}

class AggregatorTest : public ::testing::Test {
protected:
    test::ManualClock clock;
    std::shared_ptr<runtime::Context> ctx = runtime::Context::make(
        std::make_shared<test::ScriptedProber>(), std::make_shared<test::RecordingAdapter>(), clock.fn());
    stats::Aggregator agg{ctx};

    void add(const std::string& endpoint, const std::optional<Outcome>& o = std::nullopt) const {
        const auto reg = ctx->store->upsert(endpoint, {}, clock.now);
        if (o) ctx->store->apply(endpoint, reg.monitor.generation, *o, clock.now);
    }
};

TEST_F(AggregatorTest, NoEndpointsIsDegraded) {
    EXPECT_EQ(stats::Aggregator::overallStatus({}), "degraded");
    EXPECT_EQ(agg.summary(false).overall_status, "degraded");
}

TEST_F(AggregatorTest, OverallHealthyOnlyWhenAllHealthy) {
    add("https://a.example.com", outcome::Success{200, 10.0});
    add("https://b.example.com", outcome::Success{200, 20.0});
    EXPECT_EQ(agg.summary(true).overall_status, "healthy");

    add("https://c.example.com");
    EXPECT_EQ(agg.summary(true).overall_status, "degraded");
}

TEST_F(AggregatorTest, AverageResponseOverHealthyOnly) {
    add("https://a.example.com", outcome::Success{200, 10.0});
    add("https://b.example.com", outcome::Success{200, 20.005});
    add("https://c.example.com", outcome::UnexpectedStatus{500, 9000.0});

    const auto s = agg.summary(true);
    EXPECT_DOUBLE_EQ(s.average_response_time_ms, 15.0);
    EXPECT_EQ(s.healthy_endpoints, 2u);
    EXPECT_EQ(s.total_endpoints, 3u);
}

TEST_F(AggregatorTest, FilterIsCaseInsensitiveSubstring) {
    add("https://api.example.com");
    add("https://backup.example.com");
    add("https://other.net");

    EXPECT_EQ(agg.endpoints("EXAMPLE").size(), 2u);
    EXPECT_EQ(agg.endpoints("Api").size(), 1u);
    EXPECT_EQ(agg.endpoints("").size(), 3u);
    EXPECT_TRUE(agg.endpoints("nowhere").empty());
}

TEST_F(AggregatorTest, RecentAlertsWindow) {
    alert::model::Alert old;
    old.timestamp = clock.now - 2h;
    ctx->alerts->append(old);

    alert::model::Alert fresh;
    fresh.timestamp = clock.now - 10min;
    ctx->alerts->append(fresh);

    EXPECT_EQ(agg.recentAlertCount(), 1u);
}

TEST_F(AggregatorTest, OptimalWhenNothingToSay) {
    add("https://a.example.com", outcome::Success{200, 10.0});
    add("https://b.example.com", outcome::Success{200, 10.0});
    ctx->trafficTable->add("a", "b", 50);
    ctx->scalingRules->add(scaling::model::Metric::Cpu, 80, scaling::model::Action::ScaleUp);

    const auto recs = agg.recommendations(true);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0], "System is running optimally");
}

TEST_F(AggregatorTest, RecommendationsInOrderAndIdempotent) {
    add("https://a.example.com", outcome::Timeout{});
    add("https://b.example.com", outcome::Success{200, 2500.0});
    ctx->alerts->append([&] { alert::model::Alert a; a.timestamp = clock.now; return a; }());

    const auto recs = agg.recommendations(false);
    ASSERT_EQ(recs.size(), 6u);
    EXPECT_NE(recs[0].find("https://a.example.com"), std::string::npos);
    EXPECT_NE(recs[1].find("alert"), std::string::npos);
    EXPECT_NE(recs[2].find("traffic routing"), std::string::npos);
    EXPECT_NE(recs[3].find("auto-scaling"), std::string::npos);
    EXPECT_NE(recs[4].find("https://b.example.com"), std::string::npos);
    EXPECT_NE(recs[5].find("monitoring"), std::string::npos);

    EXPECT_EQ(agg.recommendations(false), recs);
}

TEST_F(AggregatorTest, SingleEndpointAsksForRedundancy) {
    add("https://a.example.com", outcome::Success{200, 10.0});
    const auto recs = agg.recommendations(true);
    ASSERT_FALSE(recs.empty());
    EXPECT_NE(recs[0].find("at least two endpoints"), std::string::npos);
}

TEST_F(AggregatorTest, ProviderFailuresAreRecommendedLast) {
    add("https://a.example.com", outcome::Success{200, 10.0});
    add("https://b.example.com", outcome::Success{200, 10.0});
    ctx->trafficTable->add("a", "b", 50);
    ctx->scalingRules->add(scaling::model::Metric::Cpu, 80, scaling::model::Action::ScaleUp);
    ctx->metrics->provider_failures += 2;

    const auto recs = agg.recommendations(true);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_NE(recs[0].find("2 intent(s)"), std::string::npos);
}

TEST_F(AggregatorTest, DetailJsonCarriesFailureStreak) {
    const auto reg = ctx->store->upsert("https://a.example.com", {}, clock.now);
    for (int i = 0; i < 2; ++i) ctx->store->apply("https://a.example.com", reg.monitor.generation, outcome::Timeout{}, clock.now);

    const nlohmann::json j = agg.endpoints().at(0);
    EXPECT_EQ(j["failures"], 2);
    EXPECT_EQ(j["consecutive_failures"], 2);
    EXPECT_EQ(j["status"], "degraded");
}
