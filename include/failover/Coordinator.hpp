#pragma once

#include "alert/model/Alert.hpp"

#include <memory>
#include <optional>
#include <string>

namespace tw::runtime { struct Context; }

namespace tw::failover {

struct Decision {
    bool success = false;
    std::optional<std::string> target;
};

class Coordinator {
public:
    explicit Coordinator(std::shared_ptr<runtime::Context> ctx);

    // Shifts traffic from `failedEndpoint` to the first healthy endpoint in key order.
    // No cooldown: every call makes a fresh decision.
    Decision failover(const std::string& failedEndpoint) const;

    // failover() plus exactly one alert describing it.
    alert::model::Alert escalate(const std::string& endpoint) const;

private:
    std::shared_ptr<runtime::Context> ctx_;
};

}
