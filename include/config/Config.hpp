#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace tw::config {

struct MonitorConfig {
    std::chrono::seconds tick_interval = std::chrono::seconds(2);
    std::chrono::seconds idle_interval = std::chrono::seconds(5);
    unsigned int probe_workers = 4;   // 0 = probe sequentially on the loop thread
    std::string user_agent = "TrafficWarden/1.0";
};

struct HealthCheckDefaults {
    int expected_status = 200;
    std::chrono::seconds timeout = std::chrono::seconds(10);
    std::chrono::seconds interval = std::chrono::seconds(30);
    unsigned int failure_threshold = 3;
};

struct ProviderConfig {
    enum class Mode { Simulated, Webhook };

    Mode mode = Mode::Simulated;
    std::string webhook_url;
    std::chrono::seconds timeout = std::chrono::seconds(5);
    unsigned int workers = 1;   // threads delivering intents; 0 = inline
};

struct ControlConfig {
    bool enabled = true;
    std::string socket_path = "/run/trafficwarden/control.sock";
    unsigned int client_timeout_ms = 5000;
};

struct EndpointEntry {
    std::string url;
    std::optional<std::chrono::seconds> interval;
    std::optional<std::chrono::seconds> timeout;
    std::optional<int> expected_status;
    std::optional<unsigned int> failure_threshold;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum trafficwarden = spdlog::level::info;   // Startup/shutdown, registrations
    spdlog::level::level_enum monitor       = spdlog::level::info;   // Tick-level events
    spdlog::level::level_enum probe         = spdlog::level::warn;   // Individual probe failures
    spdlog::level::level_enum failover      = spdlog::level::info;
    spdlog::level::level_enum traffic       = spdlog::level::info;
    spdlog::level::level_enum scaling       = spdlog::level::info;
    spdlog::level::level_enum alerts        = spdlog::level::warn;
    spdlog::level::level_enum provider      = spdlog::level::warn;   // Adapter failures
    spdlog::level::level_enum shell         = spdlog::level::warn;   // Control socket
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/trafficwarden";
    LogLevelsConfig levels;
};

struct Config {
    MonitorConfig monitor;
    HealthCheckDefaults health_check_defaults;
    ProviderConfig provider;
    ControlConfig control;
    LoggingConfig logging;
    std::vector<EndpointEntry> endpoints;
};

Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);
std::string to_yaml(const Config& c);

std::string to_string(const ProviderConfig::Mode& mode);
ProviderConfig::Mode providerModeFromString(const std::string& str);

} // namespace tw::config
