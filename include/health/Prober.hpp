#pragma once

#include "health/model/Outcome.hpp"

#include <chrono>
#include <string>

namespace tw::health {

// One liveness check against one endpoint. Network failures come back as
// Outcome variants; implementations must be callable from several threads.
class Prober {
public:
    virtual ~Prober() = default;

    [[nodiscard]] virtual model::Outcome probe(const std::string& endpoint,
                                               std::chrono::milliseconds timeout) = 0;
};

class HttpProber final : public Prober {
public:
    explicit HttpProber(std::string userAgent = "TrafficWarden/1.0");

    [[nodiscard]] model::Outcome probe(const std::string& endpoint,
                                       std::chrono::milliseconds timeout) override;

private:
    std::string userAgent_;
};

}
