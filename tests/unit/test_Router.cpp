#include <gtest/gtest.h>

#include "fakes.hpp"
#include "protocols/command/Router.hpp"
#include "runtime/Controller.hpp"
#include "runtime/Context.hpp"

using namespace tw;
using namespace tw::protocols::command;
using namespace std::chrono_literals;

class RouterTest : public ::testing::Test {
protected:
    test::ManualClock clock;
    std::shared_ptr<test::ScriptedProber> prober = std::make_shared<test::ScriptedProber>();
    std::shared_ptr<test::RecordingAdapter> adapter = std::make_shared<test::RecordingAdapter>();
    std::shared_ptr<runtime::Controller> controller;
    std::unique_ptr<Router> router;

    void SetUp() override {
        runtime::Controller::Options o;
        o.auto_start_monitor = false;
        o.monitor.probe_workers = 0;
        o.provider_workers = 0;
        controller = std::make_shared<runtime::Controller>(runtime::Context::make(prober, adapter, clock.fn()), o);
        router = std::make_unique<Router>(controller);
    }
};

TEST_F(RouterTest, RegistersFromFreeText) {
    const auto r = router->executeLine("check health of api.example.com every 10 seconds");
    EXPECT_EQ(r.exit_code, 0) << r.stderr_text;
    EXPECT_NE(r.stdout_text.find("Health check configured for https://api.example.com"), std::string::npos);
    ASSERT_TRUE(r.has_data);
    EXPECT_EQ(r.data["interval"], 10);
    EXPECT_EQ(controller->getEndpoints().size(), 1u);
}

TEST_F(RouterTest, RejectedRegistrationIsNonZero) {
    const auto r = router->executeLine("ping api.example.com every 99999999999");
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_FALSE(r.stderr_text.empty());
    EXPECT_EQ(r.data["status"], "error");
    EXPECT_TRUE(controller->getEndpoints().empty());
}

TEST_F(RouterTest, UnknownPointsAtHelp) {
    const auto r = router->executeLine("make me a sandwich");
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_NE(r.stderr_text.find("help"), std::string::npos);
    EXPECT_FALSE(r.has_data);
}

TEST_F(RouterTest, HelpText) {
    const auto r = router->executeLine("help");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_text, Router::helpText());
}

TEST_F(RouterTest, TrafficRuleReachesAdapter) {
    const auto r = router->executeLine("route api to backup with 30% traffic");
    EXPECT_EQ(r.exit_code, 0);
    ASSERT_EQ(adapter->rules.size(), 1u);
    EXPECT_EQ(adapter->rules[0].weight, 30);
    EXPECT_EQ(r.data["rule"]["target"], "backup");
}

TEST_F(RouterTest, AdapterFailureShowsInMetrics) {
    adapter->failAlarms = true;
    const auto r = router->executeLine("scale up when cpu above 80%");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.data["rule_id"], 1);
    EXPECT_EQ(controller->getStatus().summary->auto_scale_rules, 1u);

    const auto metrics = router->executeLine("metrics");
    EXPECT_EQ(metrics.data["metrics"]["provider_failures"], 1);
}

TEST_F(RouterTest, StatusOfUnknownTarget) {
    const auto r = router->executeLine("status of nowhere");
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_NE(r.stderr_text.find("nowhere"), std::string::npos);
}

TEST_F(RouterTest, SystemStatusRendersSummary) {
    router->executeLine("monitor api.example.com");
    controller->tick();

    const auto r = router->executeLine("show status");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_NE(r.stdout_text.find("Overall: healthy (1/1 healthy)"), std::string::npos);
    EXPECT_EQ(r.data["summary"]["total_endpoints"], 1);
}

TEST_F(RouterTest, StopMonitoringRemovesEndpoint) {
    router->executeLine("monitor api.example.com");
    EXPECT_EQ(router->executeLine("stop monitoring api.example.com").exit_code, 0);
    EXPECT_EQ(router->executeLine("stop monitoring api.example.com").exit_code, 1);
}

TEST_F(RouterTest, ListingCommands) {
    router->executeLine("monitor api.example.com");

    const auto endpoints = router->executeLine("endpoints");
    EXPECT_EQ(endpoints.data["total"], 1);

    const auto metrics = router->executeLine("metrics");
    EXPECT_EQ(metrics.data["metrics"]["total_requests"], 1);

    const auto alerts = router->executeLine("alerts");
    EXPECT_EQ(alerts.data["total_alerts"], 0);

    const auto recs = router->executeLine("recommendations");
    EXPECT_TRUE(recs.data["recommendations"].is_array());
    EXPECT_FALSE(recs.data["recommendations"].empty());
}

TEST_F(RouterTest, ClearResets) {
    router->executeLine("monitor api.example.com");
    const auto r = router->executeLine("clear");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_text, "All configurations cleared and system reset");
    EXPECT_TRUE(controller->getEndpoints().empty());
}
