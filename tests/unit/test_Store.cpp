#include <gtest/gtest.h>

#include "health/Store.hpp"

using namespace tw::health;
using namespace tw::health::model;
using namespace std::chrono_literals;

class StoreTest : public ::testing::Test {
protected:
    Store store;
    std::chrono::system_clock::time_point t0 = std::chrono::system_clock::time_point{} + 1000h;
};

TEST_F(StoreTest, SnapshotIsKeyOrdered) {
    store.upsert("https://c.example.com", {}, t0);
    store.upsert("https://a.example.com", {}, t0);
    store.upsert("https://b.example.com", {}, t0);

    const auto snap = store.snapshot();
    ASSERT_EQ(snap.size(), 3u);
    EXPECT_EQ(snap[0].endpoint, "https://a.example.com");
    EXPECT_EQ(snap[1].endpoint, "https://b.example.com");
    EXPECT_EQ(snap[2].endpoint, "https://c.example.com");
    for (const auto& m : snap) EXPECT_EQ(m.state, State::Initializing);
}

TEST_F(StoreTest, ReRegistrationKeepsTotalsAndResetsLiveState) {
    const auto first = store.upsert("https://a.example.com", {}, t0);
    EXPECT_FALSE(first.replaced);

    ASSERT_TRUE(store.apply("https://a.example.com", first.monitor.generation, outcome::Success{200, 5.0}, t0));
    ASSERT_TRUE(store.apply("https://a.example.com", first.monitor.generation, outcome::Timeout{}, t0));

    CheckConfig c;
    c.poll_interval = 10s;
    const auto second = store.upsert("https://a.example.com", c, t0 + 1h);
    EXPECT_TRUE(second.replaced);

    const auto m = *store.get("https://a.example.com");
    EXPECT_EQ(m.state, State::Initializing);
    EXPECT_EQ(m.consecutive_failures, 0u);
    EXPECT_FALSE(m.last_probe_at);
    EXPECT_FALSE(m.last_error);
    EXPECT_EQ(m.success_count, 1u);
    EXPECT_EQ(m.failure_count, 1u);
    EXPECT_EQ(m.created_at, t0);
    EXPECT_EQ(m.config.poll_interval, 10s);
}

TEST_F(StoreTest, StaleGenerationIsDropped) {
    const auto first = store.upsert("https://a.example.com", {}, t0);
    store.upsert("https://a.example.com", {}, t0);

    EXPECT_FALSE(store.apply("https://a.example.com", first.monitor.generation, outcome::Timeout{}, t0));
    EXPECT_EQ(store.get("https://a.example.com")->failure_count, 0u);
}

TEST_F(StoreTest, RemovedEndpointIgnoresLateResult) {
    const auto reg = store.upsert("https://a.example.com", {}, t0);
    EXPECT_TRUE(store.remove("https://a.example.com"));
    EXPECT_FALSE(store.remove("https://a.example.com"));
    EXPECT_FALSE(store.apply("https://a.example.com", reg.monitor.generation, outcome::Timeout{}, t0));
    EXPECT_TRUE(store.empty());
}

TEST_F(StoreTest, RemoveThenRegisterStartsFromZero) {
    const auto reg = store.upsert("https://a.example.com", {}, t0);
    store.apply("https://a.example.com", reg.monitor.generation, outcome::Success{200, 5.0}, t0);
    store.remove("https://a.example.com");

    const auto again = store.upsert("https://a.example.com", {}, t0 + 1h);
    EXPECT_FALSE(again.replaced);
    EXPECT_EQ(again.monitor.success_count, 0u);
    EXPECT_EQ(again.monitor.created_at, t0 + 1h);
}

TEST_F(StoreTest, DueSelection) {
    CheckConfig c;
    c.poll_interval = 30s;
    const auto reg = store.upsert("https://a.example.com", c, t0);
    EXPECT_TRUE(reg.monitor.isDue(t0));

    store.apply("https://a.example.com", reg.monitor.generation, outcome::Success{200, 1.0}, t0);
    const auto m = *store.get("https://a.example.com");
    EXPECT_FALSE(m.isDue(t0 + 29s));
    EXPECT_TRUE(m.isDue(t0 + 30s));
}
