#include "scaling/model/Rule.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace tw::scaling::model;

std::string tw::scaling::model::to_string(const Metric m) {
    switch (m) {
        case Metric::Cpu: return "cpu";
        case Metric::Memory: return "memory";
        case Metric::Disk: return "disk";
        case Metric::Network: return "network";
        default: throw std::invalid_argument("Unknown scaling metric");
    }
}

std::string tw::scaling::model::to_string(const Action a) {
    switch (a) {
        case Action::ScaleUp: return "scale_up";
        case Action::ScaleDown: return "scale_down";
        default: throw std::invalid_argument("Unknown scaling action");
    }
}

Metric tw::scaling::model::metricFromString(const std::string& str) {
    if (str == "cpu") return Metric::Cpu;
    if (str == "memory") return Metric::Memory;
    if (str == "disk") return Metric::Disk;
    if (str == "network") return Metric::Network;
    throw std::invalid_argument("Unknown scaling metric: " + str);
}

Action tw::scaling::model::actionFromString(const std::string& str) {
    if (str == "scale_up") return Action::ScaleUp;
    if (str == "scale_down") return Action::ScaleDown;
    throw std::invalid_argument("Unknown scaling action: " + str);
}

void tw::scaling::model::to_json(nlohmann::json& j, const Rule& r) {
    j = {
        {"id", r.id},
        {"metric", to_string(r.metric)},
        {"threshold", r.threshold},
        {"action", to_string(r.action)},
        {"cooldown", r.cooldown.count()}
    };
}
