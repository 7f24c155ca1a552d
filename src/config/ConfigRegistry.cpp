#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace tw::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        config_ = loadConfig(path);
        source_ = path;
        initialized_.store(true, std::memory_order_release);
    });
}

void ConfigRegistry::init(const Config& config) {
    std::call_once(init_flag_, [&]() {
        config_ = config;
        source_.clear();
        initialized_.store(true, std::memory_order_release);
    });
}

const Config& ConfigRegistry::get() {
    if (!isInitialized())
        throw std::runtime_error("[ConfigRegistry] Configuration requested before init()");
    return config_;
}

} // namespace tw::config
