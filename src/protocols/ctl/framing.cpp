#include "protocols/ctl/framing.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace tw::protocols::ctl {

bool readn(const int fd, void* buf, size_t n) {
    auto* p = static_cast<unsigned char*>(buf);
    while (n) {
        const ssize_t r = ::read(fd, p, n);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return false;
        p += r;
        n -= static_cast<size_t>(r);
    }
    return true;
}

bool writen(const int fd, const void* buf, size_t n) {
    auto* p = static_cast<const unsigned char*>(buf);
    while (n) {
        const ssize_t w = ::write(fd, p, n);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        p += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}

void sendJson(const int fd, const nlohmann::json& j) {
    const auto s = j.dump();
    const auto len = htonl(static_cast<uint32_t>(s.size()));
    if (!writen(fd, &len, 4) || !writen(fd, s.data(), s.size()))
        throw std::runtime_error("Short write on control socket");
}

nlohmann::json recvJson(const int fd) {
    uint32_t be = 0;
    if (!readn(fd, &be, 4)) throw std::runtime_error("Connection closed or timed out reading frame length");

    const uint32_t len = ntohl(be);
    if (len > MAX_FRAME_BYTES) throw std::runtime_error(fmt::format("Frame of {} bytes exceeds limit", len));

    std::string body(len, '\0');
    if (!readn(fd, body.data(), len)) throw std::runtime_error("Connection closed or timed out reading frame body");
    return nlohmann::json::parse(body);
}

}
