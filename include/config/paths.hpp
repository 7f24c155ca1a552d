#pragma once

#include <cstdlib>
#include <filesystem>

namespace tw::paths {

inline constexpr const char* kDefaultConfigPath = "/etc/trafficwarden/config.yaml";
inline constexpr const char* kConfigEnvVar = "TRAFFICWARDEN_CONFIG";

// TRAFFICWARDEN_CONFIG wins over the packaged default
inline std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv(kConfigEnvVar); env && *env) return {env};
    return {kDefaultConfigPath};
}

inline std::filesystem::path getTestLogPath() {
    return std::filesystem::temp_directory_path() / "trafficwarden-test";
}

}
