#include <gtest/gtest.h>

#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

using namespace tw::config;
using namespace std::chrono_literals;

TEST(ConfigTest, EmptyDocumentGivesDefaults) {
    const auto cnf = parseConfig("{}");
    EXPECT_EQ(cnf.monitor.tick_interval, 2s);
    EXPECT_EQ(cnf.monitor.probe_workers, 4u);
    EXPECT_EQ(cnf.health_check_defaults.failure_threshold, 3u);
    EXPECT_EQ(cnf.health_check_defaults.interval, 30s);
    EXPECT_EQ(cnf.provider.mode, ProviderConfig::Mode::Simulated);
    EXPECT_TRUE(cnf.control.enabled);
    EXPECT_EQ(cnf.control.client_timeout_ms, 5000u);
    EXPECT_EQ(cnf.provider.workers, 1u);
    EXPECT_TRUE(cnf.endpoints.empty());
}

TEST(ConfigTest, SectionsOverrideDefaults) {
    const auto cnf = parseConfig(R"(
monitor:
  tick_interval_seconds: 1
  probe_workers: 0
provider:
  workers: 0
control:
  client_timeout_ms: 250
health_check_defaults:
  expected_status: 204
  failure_threshold: 5
logging:
  log_dir: /tmp/tw-logs
  log_levels:
    console_log_level: debug
    subsystem_levels:
      probe: error
)");
    EXPECT_EQ(cnf.monitor.tick_interval, 1s);
    EXPECT_EQ(cnf.monitor.probe_workers, 0u);
    EXPECT_EQ(cnf.provider.workers, 0u);
    EXPECT_EQ(cnf.control.client_timeout_ms, 250u);
    EXPECT_EQ(cnf.health_check_defaults.expected_status, 204);
    EXPECT_EQ(cnf.health_check_defaults.failure_threshold, 5u);
    EXPECT_EQ(cnf.logging.log_dir.string(), "/tmp/tw-logs");
    EXPECT_EQ(cnf.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cnf.logging.levels.subsystem_levels.probe, spdlog::level::err);
    EXPECT_EQ(cnf.logging.levels.subsystem_levels.monitor, spdlog::level::info);
}

TEST(ConfigTest, EndpointsScalarAndMap) {
    const auto cnf = parseConfig(R"(
endpoints:
  - https://api.example.com/health
  - url: backup.example.com
    interval_seconds: 15
    failure_threshold: 2
)");
    ASSERT_EQ(cnf.endpoints.size(), 2u);
    EXPECT_EQ(cnf.endpoints[0].url, "https://api.example.com/health");
    EXPECT_FALSE(cnf.endpoints[0].interval);
    EXPECT_EQ(cnf.endpoints[1].url, "backup.example.com");
    EXPECT_EQ(cnf.endpoints[1].interval, 15s);
    EXPECT_EQ(cnf.endpoints[1].failure_threshold, 2u);
    EXPECT_FALSE(cnf.endpoints[1].timeout);
}

TEST(ConfigTest, EndpointMapWithoutUrlIsRejected) {
    EXPECT_THROW(parseConfig("endpoints:\n  - interval_seconds: 5\n"), YAML::Exception);
}

TEST(ConfigTest, WebhookNeedsUrl) {
    EXPECT_THROW(parseConfig("provider:\n  mode: webhook\n"), std::runtime_error);

    const auto cnf = parseConfig("provider:\n  mode: webhook\n  webhook_url: http://hooks.local/tw\n");
    EXPECT_EQ(cnf.provider.mode, ProviderConfig::Mode::Webhook);
    EXPECT_EQ(cnf.provider.webhook_url, "http://hooks.local/tw");
}

TEST(ConfigTest, ZeroTickIntervalIsRejected) {
    EXPECT_THROW(parseConfig("monitor:\n  tick_interval_seconds: 0\n"), std::runtime_error);
}

TEST(ConfigTest, ProviderModes) {
    EXPECT_EQ(providerModeFromString("simulated"), ProviderConfig::Mode::Simulated);
    EXPECT_EQ(providerModeFromString("mock"), ProviderConfig::Mode::Simulated);
    EXPECT_EQ(providerModeFromString("webhook"), ProviderConfig::Mode::Webhook);
    EXPECT_THROW(providerModeFromString("aws"), std::invalid_argument);
    EXPECT_EQ(to_string(ProviderConfig::Mode::Webhook), "webhook");
}

TEST(ConfigTest, YamlRoundTripKeepsEndpoints) {
    auto cnf = parseConfig("endpoints:\n  - url: a.local\n    expected_status: 204\n");
    const auto again = parseConfig(to_yaml(cnf));
    ASSERT_EQ(again.endpoints.size(), 1u);
    EXPECT_EQ(again.endpoints[0].expected_status, 204);
    EXPECT_EQ(again.monitor.user_agent, cnf.monitor.user_agent);
}

TEST(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadConfig("/nonexistent/trafficwarden.yaml"), std::runtime_error);
}

TEST(ConfigRegistryTest, FirstInitWins) {
    // gtest_main installs an in-memory config before any test runs
    ASSERT_TRUE(ConfigRegistry::isInitialized());
    EXPECT_TRUE(ConfigRegistry::source().empty());

    Config other;
    other.monitor.user_agent = "ignored";
    ConfigRegistry::init(other);
    EXPECT_NE(ConfigRegistry::get().monitor.user_agent, "ignored");
}
