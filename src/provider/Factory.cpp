#include "provider/Factory.hpp"
#include "provider/SimulatedAdapter.hpp"
#include "provider/WebhookAdapter.hpp"
#include "config/Config.hpp"

#include <stdexcept>

std::shared_ptr<tw::provider::Adapter> tw::provider::makeAdapter(const config::ProviderConfig& cnf,
                                                                 const std::string& userAgent) {
    switch (cnf.mode) {
        case config::ProviderConfig::Mode::Simulated:
            return std::make_shared<SimulatedAdapter>();
        case config::ProviderConfig::Mode::Webhook:
            return std::make_shared<WebhookAdapter>(cnf.webhook_url, cnf.timeout, userAgent);
        default:
            throw std::invalid_argument("Unknown provider mode");
    }
}
