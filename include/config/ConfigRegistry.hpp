#pragma once

#include "config/Config.hpp"
#include "config/paths.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>

namespace tw::config {

// Process-wide configuration, set once at startup.
class ConfigRegistry {
public:
    // Loads `path`; only the first init() of either kind takes effect.
    static void init(const std::filesystem::path& path = paths::getConfigPath());

    // Installs an already-built config (tests, embedded use).
    static void init(const Config& config);

    static const Config& get();

    [[nodiscard]] static bool isInitialized() { return initialized_.load(std::memory_order_acquire); }

    // File the config was read from; empty when it was installed in memory.
    [[nodiscard]] static const std::filesystem::path& source() { return source_; }

private:
    static inline Config config_;
    static inline std::filesystem::path source_;
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;
};

} // namespace tw::config
