#pragma once

#include <memory>
#include <string>

namespace tw::config { struct ProviderConfig; }

namespace tw::provider {

class Adapter;

std::shared_ptr<Adapter> makeAdapter(const config::ProviderConfig& cnf, const std::string& userAgent);

}
