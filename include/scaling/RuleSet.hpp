#pragma once

#include "scaling/model/Rule.hpp"

#include <shared_mutex>
#include <vector>

namespace tw::scaling {

class RuleSet {
public:
    model::Rule add(model::Metric metric, double threshold, model::Action action);

    [[nodiscard]] std::vector<model::Rule> rules() const;
    [[nodiscard]] size_t size() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::vector<model::Rule> rules_;
};

}
