#include "protocols/ctl/Server.hpp"
#include "protocols/ctl/framing.hpp"
#include "protocols/command/Router.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

using nlohmann::json;
using namespace tw::protocols::ctl;

namespace {

// Slice length for waits that must notice stop()
constexpr int POLL_SLICE_MS = 100;

void setIoTimeouts(const int fd, const std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
        throw std::runtime_error(fmt::format("setsockopt(): {}", std::strerror(errno)));
}

}

Server::Server(std::shared_ptr<command::Router> router, std::string socketPath,
               const std::chrono::milliseconds clientTimeout)
    : AsyncService("ControlServer"),
      router_(std::move(router)),
      socketPath_(std::move(socketPath)),
      clientTimeout_(clientTimeout) {}

Server::~Server() {
    stop();
    closeListener();
}

void Server::closeListener() {
    if (const int fd = listenFd_.exchange(-1); fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
        ::unlink(socketPath_.c_str());
    }
}

void Server::onStop() {
    closeListener();
}

void Server::bindListener() {
    sockaddr_un addr{};
    if (socketPath_.size() >= sizeof(addr.sun_path))
        throw std::runtime_error(fmt::format("Socket path too long: {}", socketPath_));

    if (const auto dir = std::filesystem::path(socketPath_).parent_path(); !dir.empty())
        std::filesystem::create_directories(dir);

    ::unlink(socketPath_.c_str());
    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) throw std::runtime_error(fmt::format("socket(): {}", std::strerror(errno)));
    listenFd_ = fd;

    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socketPath_.c_str());
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr),
               sizeof(sa_family_t) + std::strlen(addr.sun_path) + 1) != 0)
        throw std::runtime_error(fmt::format("bind({}): {}", socketPath_, std::strerror(errno)));
    ::chmod(socketPath_.c_str(), 0660);

    if (::listen(fd, 16) != 0) throw std::runtime_error(fmt::format("listen(): {}", std::strerror(errno)));
}

void Server::start() {
    if (isRunning()) return;
    bindListener();
    log::Registry::shell()->info("[ControlServer] Listening on {}", socketPath_);
    AsyncService::start();
}

void Server::runLoop() {
    while (!interruptFlag_.load()) {
        const int cfd = ::accept4(listenFd_.load(), nullptr, nullptr, SOCK_CLOEXEC);
        if (cfd < 0) {
            if (interruptFlag_.load()) break;   // listener closed during stop
            if (errno == EINTR || errno == ECONNABORTED) continue;
            throw std::runtime_error(fmt::format("accept(): {}", std::strerror(errno)));
        }

        serve(cfd);
        ::close(cfd);
    }
}

// Waits for the first request byte. False on timeout, hangup or stop().
bool Server::awaitRequest(const int cfd) const {
    const auto deadline = std::chrono::steady_clock::now() + clientTimeout_;
    pollfd pfd{cfd, POLLIN, 0};

    while (!interruptFlag_.load()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;

        const int rc = ::poll(&pfd, 1, POLL_SLICE_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(fmt::format("poll(): {}", std::strerror(errno)));
        }
        if (rc > 0) return (pfd.revents & POLLIN) != 0;
    }
    return false;
}

void Server::serve(const int cfd) const {
    try {
        // Bounds a client that stalls mid-frame or stops reading the reply
        setIoTimeouts(cfd, clientTimeout_);

        if (!awaitRequest(cfd)) {
            log::Registry::shell()->warn("[ControlServer] Dropping client that sent no request within {} ms",
                                         clientTimeout_.count());
            return;
        }

        const auto req = recvJson(cfd);

        std::string line = "help";
        if (req.contains("line") && req["line"].is_string() && !req["line"].get<std::string>().empty())
            line = req["line"].get<std::string>();

        log::Registry::shell()->debug("[ControlServer] Request: '{}'", line);
        const auto res = router_->executeLine(line);

        json reply{
            {"ok", res.exit_code == 0},
            {"exit_code", res.exit_code},
            {"stdout", res.stdout_text},
            {"stderr", res.stderr_text}
        };
        if (res.has_data) reply["data"] = res.data;
        sendJson(cfd, reply);
    } catch (const std::exception& e) {
        log::Registry::shell()->warn("[ControlServer] Bad request: {}", e.what());
        try {
            sendJson(cfd, {{"ok", false}, {"exit_code", 1}, {"stdout", ""}, {"stderr", e.what()}});
        } catch (const std::exception& writeErr) {
            log::Registry::shell()->debug("[ControlServer] Client went away: {}", writeErr.what());
        }
    }
}
