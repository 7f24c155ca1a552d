#include "alert/model/Alert.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace tw::alert::model;

void tw::alert::model::to_json(nlohmann::json& j, const Alert& a) {
    j = {
        {"id", a.id},
        {"timestamp", util::timestampToString(a.timestamp)},
        {"type", a.type},
        {"endpoint", a.endpoint},
        {"state", health::model::to_string(a.state)},
        {"consecutive_failures", a.consecutive_failures},
        {"last_error", a.last_error ? nlohmann::json(*a.last_error) : nlohmann::json(nullptr)},
        {"action_taken", a.action_taken},
        {"failover_success", a.failover_success},
        {"failover_target", a.failover_target ? nlohmann::json(*a.failover_target) : nlohmann::json(nullptr)}
    };
}
