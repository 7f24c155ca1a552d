#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace tw::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<MonitorConfig> {
    static Node encode(const MonitorConfig& rhs) {
        Node node;
        node["tick_interval_seconds"] = rhs.tick_interval.count();
        node["idle_interval_seconds"] = rhs.idle_interval.count();
        node["probe_workers"] = rhs.probe_workers;
        node["user_agent"] = rhs.user_agent;
        return node;
    }

    static bool decode(const Node& node, MonitorConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tick_interval = std::chrono::seconds(node["tick_interval_seconds"].as<unsigned int>(2));
        rhs.idle_interval = std::chrono::seconds(node["idle_interval_seconds"].as<unsigned int>(5));
        rhs.probe_workers = node["probe_workers"].as<unsigned int>(4);
        rhs.user_agent = node["user_agent"].as<std::string>("TrafficWarden/1.0");
        return true;
    }
};

template<>
struct convert<HealthCheckDefaults> {
    static Node encode(const HealthCheckDefaults& rhs) {
        Node node;
        node["expected_status"] = rhs.expected_status;
        node["timeout_seconds"] = rhs.timeout.count();
        node["interval_seconds"] = rhs.interval.count();
        node["failure_threshold"] = rhs.failure_threshold;
        return node;
    }

    static bool decode(const Node& node, HealthCheckDefaults& rhs) {
        if (!node.IsMap()) return false;
        rhs.expected_status = node["expected_status"].as<int>(200);
        rhs.timeout = std::chrono::seconds(node["timeout_seconds"].as<unsigned int>(10));
        rhs.interval = std::chrono::seconds(node["interval_seconds"].as<unsigned int>(30));
        rhs.failure_threshold = node["failure_threshold"].as<unsigned int>(3);
        return true;
    }
};

template<>
struct convert<ProviderConfig> {
    static Node encode(const ProviderConfig& rhs) {
        Node node;
        node["mode"] = to_string(rhs.mode);
        node["webhook_url"] = rhs.webhook_url;
        node["timeout_seconds"] = rhs.timeout.count();
        node["workers"] = rhs.workers;
        return node;
    }

    static bool decode(const Node& node, ProviderConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mode = providerModeFromString(node["mode"].as<std::string>("simulated"));
        rhs.webhook_url = node["webhook_url"].as<std::string>("");
        rhs.timeout = std::chrono::seconds(node["timeout_seconds"].as<unsigned int>(5));
        rhs.workers = node["workers"].as<unsigned int>(1);
        return true;
    }
};

template<>
struct convert<ControlConfig> {
    static Node encode(const ControlConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["socket_path"] = rhs.socket_path;
        node["client_timeout_ms"] = rhs.client_timeout_ms;
        return node;
    }

    static bool decode(const Node& node, ControlConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.socket_path = node["socket_path"].as<std::string>("/run/trafficwarden/control.sock");
        rhs.client_timeout_ms = node["client_timeout_ms"].as<unsigned int>(5000);
        return true;
    }
};

template<>
struct convert<EndpointEntry> {
    static Node encode(const EndpointEntry& rhs) {
        Node node;
        node["url"] = rhs.url;
        if (rhs.interval) node["interval_seconds"] = rhs.interval->count();
        if (rhs.timeout) node["timeout_seconds"] = rhs.timeout->count();
        if (rhs.expected_status) node["expected_status"] = *rhs.expected_status;
        if (rhs.failure_threshold) node["failure_threshold"] = *rhs.failure_threshold;
        return node;
    }

    static bool decode(const Node& node, EndpointEntry& rhs) {
        // Shorthand: a bare string is just the url
        if (node.IsScalar()) {
            rhs.url = node.as<std::string>();
            return true;
        }
        if (!node.IsMap() || !node["url"]) return false;
        rhs.url = node["url"].as<std::string>();
        if (node["interval_seconds"]) rhs.interval = std::chrono::seconds(node["interval_seconds"].as<unsigned int>());
        if (node["timeout_seconds"]) rhs.timeout = std::chrono::seconds(node["timeout_seconds"].as<unsigned int>());
        if (node["expected_status"]) rhs.expected_status = node["expected_status"].as<int>();
        if (node["failure_threshold"]) rhs.failure_threshold = node["failure_threshold"].as<unsigned int>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["trafficwarden"] = to_std_string(spdlog::level::to_string_view(rhs.trafficwarden));
        node["monitor"]       = to_std_string(spdlog::level::to_string_view(rhs.monitor));
        node["probe"]         = to_std_string(spdlog::level::to_string_view(rhs.probe));
        node["failover"]      = to_std_string(spdlog::level::to_string_view(rhs.failover));
        node["traffic"]       = to_std_string(spdlog::level::to_string_view(rhs.traffic));
        node["scaling"]       = to_std_string(spdlog::level::to_string_view(rhs.scaling));
        node["alerts"]        = to_std_string(spdlog::level::to_string_view(rhs.alerts));
        node["provider"]      = to_std_string(spdlog::level::to_string_view(rhs.provider));
        node["shell"]         = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.trafficwarden = spdlog::level::from_str(node["trafficwarden"].as<std::string>("info"));
        rhs.monitor = spdlog::level::from_str(node["monitor"].as<std::string>("info"));
        rhs.probe = spdlog::level::from_str(node["probe"].as<std::string>("warning"));
        rhs.failover = spdlog::level::from_str(node["failover"].as<std::string>("info"));
        rhs.traffic = spdlog::level::from_str(node["traffic"].as<std::string>("info"));
        rhs.scaling = spdlog::level::from_str(node["scaling"].as<std::string>("info"));
        rhs.alerts = spdlog::level::from_str(node["alerts"].as<std::string>("warning"));
        rhs.provider = spdlog::level::from_str(node["provider"].as<std::string>("warning"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warning"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/trafficwarden");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
