#pragma once

#include "traffic/model/Rule.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tw::traffic {

// Append-only. Rules are never merged, edited or removed short of clear().
class Table {
public:
    model::Rule add(const std::string& source, const std::string& target, long long weight,
                    const std::optional<std::string>& condition = std::nullopt);

    [[nodiscard]] std::vector<model::Rule> rules() const;
    [[nodiscard]] size_t size() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::vector<model::Rule> rules_;
};

}
