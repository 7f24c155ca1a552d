#include <gtest/gtest.h>

#include "fakes.hpp"
#include "failover/Coordinator.hpp"
#include "health/Store.hpp"
#include "alert/Log.hpp"
#include "runtime/Context.hpp"

using namespace tw;
using namespace tw::health::model;
using namespace std::chrono_literals;

class CoordinatorTest : public ::testing::Test {
protected:
    test::ManualClock clock;
    std::shared_ptr<test::RecordingAdapter> adapter = std::make_shared<test::RecordingAdapter>();
    std::shared_ptr<runtime::Context> ctx = runtime::Context::make(std::make_shared<test::ScriptedProber>(), adapter, clock.fn());
    failover::Coordinator coordinator{ctx};

    void addWithState(const std::string& endpoint, const Outcome& o) const {
        const auto reg = ctx->store->upsert(endpoint, {}, clock.now);
        ctx->store->apply(endpoint, reg.monitor.generation, o, clock.now);
    }
};

TEST_F(CoordinatorTest, PicksFirstHealthyInKeyOrder) {
    addWithState("https://a.example.com", outcome::Timeout{});
    addWithState("https://c.example.com", outcome::Success{200, 1.0});
    addWithState("https://b.example.com", outcome::Success{200, 1.0});

    const auto d = coordinator.failover("https://a.example.com");
    EXPECT_TRUE(d.success);
    EXPECT_EQ(d.target, "https://b.example.com");
}

TEST_F(CoordinatorTest, NoHealthyCandidate) {
    addWithState("https://a.example.com", outcome::Timeout{});
    addWithState("https://b.example.com", outcome::Timeout{});

    const auto d = coordinator.failover("https://a.example.com");
    EXPECT_FALSE(d.success);
    EXPECT_FALSE(d.target);
    EXPECT_TRUE(adapter->shifts.empty());
}

TEST_F(CoordinatorTest, NeverFailsOverToItself) {
    addWithState("https://a.example.com", outcome::Success{200, 1.0});
    EXPECT_FALSE(coordinator.failover("https://a.example.com").success);
}

TEST_F(CoordinatorTest, AdapterFailureIsReportedNotThrown) {
    addWithState("https://a.example.com", outcome::Timeout{});
    addWithState("https://b.example.com", outcome::Success{200, 1.0});
    adapter->failShifts = true;

    const auto a = coordinator.escalate("https://a.example.com");
    EXPECT_FALSE(a.failover_success);
    EXPECT_EQ(ctx->alerts->size(), 1u);
}

TEST_F(CoordinatorTest, EscalateRecordsOneAlertWithSnapshot) {
    addWithState("https://a.example.com", outcome::ConnectionFailed{"refused"});

    const auto a = coordinator.escalate("https://a.example.com");
    EXPECT_EQ(a.id, 1u);
    EXPECT_EQ(a.type, "endpoint_unhealthy");
    EXPECT_EQ(a.action_taken, "failover_attempted");
    EXPECT_EQ(a.endpoint, "https://a.example.com");
    EXPECT_EQ(a.last_error, "Connection failed");
    EXPECT_EQ(a.consecutive_failures, 1u);
    EXPECT_EQ(a.timestamp, clock.now);
    EXPECT_FALSE(a.failover_success);
    EXPECT_EQ(ctx->alerts->size(), 1u);
}
