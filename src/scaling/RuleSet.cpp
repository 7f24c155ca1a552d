#include "scaling/RuleSet.hpp"

#include <mutex>

using namespace tw::scaling;
using namespace tw::scaling::model;

Rule RuleSet::add(const Metric metric, const double threshold, const Action action) {
    std::unique_lock lock(mutex_);
    Rule r;
    r.id = rules_.size() + 1;
    r.metric = metric;
    r.threshold = threshold;
    r.action = action;
    rules_.push_back(r);
    return r;
}

std::vector<Rule> RuleSet::rules() const {
    std::shared_lock lock(mutex_);
    return rules_;
}

size_t RuleSet::size() const {
    std::shared_lock lock(mutex_);
    return rules_.size();
}

void RuleSet::clear() {
    std::unique_lock lock(mutex_);
    rules_.clear();
}
