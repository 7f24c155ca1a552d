#include "traffic/model/Rule.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace tw::traffic::model;

int Rule::clampWeight(const long long weight) {
    return static_cast<int>(std::clamp<long long>(weight, MIN_WEIGHT, MAX_WEIGHT));
}

void tw::traffic::model::to_json(nlohmann::json& j, const Rule& r) {
    j = {
        {"id", r.id},
        {"source_pattern", r.source_pattern},
        {"target", r.target},
        {"weight", r.weight},
        {"condition", r.condition ? nlohmann::json(*r.condition) : nlohmann::json(nullptr)}
    };
}
