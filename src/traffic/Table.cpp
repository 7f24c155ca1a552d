#include "traffic/Table.hpp"

#include <mutex>

using namespace tw::traffic;
using namespace tw::traffic::model;

Rule Table::add(const std::string& source, const std::string& target, const long long weight,
                const std::optional<std::string>& condition) {
    std::unique_lock lock(mutex_);
    Rule r;
    r.id = rules_.size() + 1;
    r.source_pattern = source;
    r.target = target;
    r.weight = Rule::clampWeight(weight);
    r.condition = condition;
    rules_.push_back(r);
    return r;
}

std::vector<Rule> Table::rules() const {
    std::shared_lock lock(mutex_);
    return rules_;
}

size_t Table::size() const {
    std::shared_lock lock(mutex_);
    return rules_.size();
}

void Table::clear() {
    std::unique_lock lock(mutex_);
    rules_.clear();
}
