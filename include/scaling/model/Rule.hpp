#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tw::scaling::model {

enum class Metric { Cpu, Memory, Disk, Network };
enum class Action { ScaleUp, ScaleDown };

struct Rule {
    std::size_t id{};
    Metric metric{Metric::Cpu};
    double threshold{};
    Action action{Action::ScaleUp};
    std::chrono::seconds cooldown = std::chrono::seconds(300);   // recorded, enforced by the provider
};

std::string to_string(Metric m);
std::string to_string(Action a);

Metric metricFromString(const std::string& str);
Action actionFromString(const std::string& str);

void to_json(nlohmann::json& j, const Rule& r);

}
