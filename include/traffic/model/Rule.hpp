#pragma once

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tw::traffic::model {

struct Rule {
    static constexpr int MIN_WEIGHT = 0;
    static constexpr int MAX_WEIGHT = 100;

    std::size_t id{};              // 1-based insertion index
    std::string source_pattern;
    std::string target;
    int weight = MAX_WEIGHT;
    std::optional<std::string> condition;   // opaque to the engine

    [[nodiscard]] static int clampWeight(long long weight);
};

void to_json(nlohmann::json& j, const Rule& r);

}
