#include "config/ConfigRegistry.hpp"
#include "protocols/ctl/framing.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace tw;

namespace {

std::string socketPath() {
    if (const char* env = std::getenv("TRAFFICWARDEN_SOCKET"); env && *env) return env;
    try {
        config::ConfigRegistry::init();
        return config::ConfigRegistry::get().control.socket_path;
    } catch (const std::exception&) {
        return config::ControlConfig{}.socket_path;   // no readable config; use the packaged default
    }
}

}

int main(const int argc, char** argv) {
    if (argc < 2) {
        fmt::print(stderr, "usage: twctl <command...>   (try: twctl help)\n");
        return 2;
    }

    std::string line = argv[1];
    for (int i = 2; i < argc; ++i) line += std::string(" ") + argv[i];

    const auto path = socketPath();
    const int s = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (s < 0) {
        fmt::print(stderr, "socket: {}\n", std::strerror(errno));
        return 1;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());
    if (::connect(s, reinterpret_cast<sockaddr*>(&addr), sizeof(sa_family_t) + std::strlen(addr.sun_path) + 1) != 0) {
        fmt::print(stderr, "connect {}: {}\n", path, std::strerror(errno));
        ::close(s);
        return 1;
    }

    try {
        protocols::ctl::sendJson(s, {{"line", line}});
        const auto r = protocols::ctl::recvJson(s);
        ::close(s);

        if (const auto out = r.value("stdout", std::string{}); !out.empty()) fmt::print("{}", out);
        if (const auto err = r.value("stderr", std::string{}); !err.empty()) fmt::print(stderr, "{}\n", err);
        return r.value("exit_code", 0);
    } catch (const std::exception& e) {
        ::close(s);
        fmt::print(stderr, "twctl: {}\n", e.what());
        return 1;
    }
}
