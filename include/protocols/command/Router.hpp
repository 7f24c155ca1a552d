#pragma once

#include "protocols/command/types.hpp"

#include <memory>
#include <string>

namespace tw::runtime { class Controller; }

namespace tw::protocols::command {

// Maps parsed commands onto the controller and renders the reply.
class Router {
public:
    explicit Router(std::shared_ptr<runtime::Controller> controller);

    CommandResult executeLine(const std::string& line) const;

    CommandResult execute(const Command& cmd) const;

    static std::string helpText();

private:
    std::shared_ptr<runtime::Controller> controller_;

    CommandResult handle(const HealthCheck& c) const;
    CommandResult handle(const Unregister& c) const;
    CommandResult handle(const RouteTraffic& c) const;
    CommandResult handle(const AutoScale& c) const;
    CommandResult handle(const Status& c) const;
    CommandResult handle(const Alerts&) const;
    CommandResult handle(const Recommendations&) const;
    CommandResult handle(const Endpoints&) const;
    CommandResult handle(const Metrics&) const;
    CommandResult handle(const Help&) const;
    CommandResult handle(const Clear&) const;
    CommandResult handle(const Unknown& c) const;
};

}
