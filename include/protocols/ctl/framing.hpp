#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace tw::protocols::ctl {

// Control-socket frames: 4-byte big-endian length, then that many bytes of JSON.
inline constexpr uint32_t MAX_FRAME_BYTES = 1u << 20;

bool readn(int fd, void* buf, size_t n);
bool writen(int fd, const void* buf, size_t n);

// Throws std::runtime_error on a short write.
void sendJson(int fd, const nlohmann::json& j);

// Throws std::runtime_error on EOF or an oversized frame, nlohmann::json::parse_error on bad JSON.
nlohmann::json recvJson(int fd);

}
