#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace tw::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;

    if (auto node = root["monitor"]) YAML::convert<MonitorConfig>::decode(node, cfg.monitor);
    if (auto node = root["health_check_defaults"]) YAML::convert<HealthCheckDefaults>::decode(node, cfg.health_check_defaults);
    if (auto node = root["provider"]) YAML::convert<ProviderConfig>::decode(node, cfg.provider);
    if (auto node = root["control"]) YAML::convert<ControlConfig>::decode(node, cfg.control);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["endpoints"]) cfg.endpoints = node.as<std::vector<EndpointEntry>>();

    if (cfg.monitor.tick_interval.count() == 0)
        throw std::runtime_error("monitor.tick_interval_seconds must be positive");
    if (cfg.provider.mode == ProviderConfig::Mode::Webhook && cfg.provider.webhook_url.empty())
        throw std::runtime_error("provider.webhook_url is required when provider.mode is webhook");

    return cfg;
}

}

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Config file not found: " + path.string());
    return fromRoot(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

std::string to_yaml(const Config& c) {
    YAML::Node root;
    root["monitor"] = c.monitor;
    root["health_check_defaults"] = c.health_check_defaults;
    root["provider"] = c.provider;
    root["control"] = c.control;
    root["logging"] = c.logging;
    root["endpoints"] = c.endpoints;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

std::string to_string(const ProviderConfig::Mode& mode) {
    switch (mode) {
        case ProviderConfig::Mode::Simulated: return "simulated";
        case ProviderConfig::Mode::Webhook: return "webhook";
        default: throw std::invalid_argument("Unknown provider mode");
    }
}

ProviderConfig::Mode providerModeFromString(const std::string& str) {
    if (str == "simulated" || str == "mock") return ProviderConfig::Mode::Simulated;
    if (str == "webhook") return ProviderConfig::Mode::Webhook;
    throw std::invalid_argument("Unknown provider mode: " + str);
}

} // namespace tw::config
