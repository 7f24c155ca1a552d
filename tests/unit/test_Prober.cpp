#include <gtest/gtest.h>

#include "health/Prober.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace tw::health;
using namespace tw::health::model;
using namespace std::chrono_literals;

namespace {

// Listening TCP socket on an ephemeral loopback port
class LoopbackListener {
public:
    LoopbackListener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) throw std::runtime_error("socket()");

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd_, 8) != 0) {
            ::close(fd_);
            throw std::runtime_error("bind()/listen()");
        }

        socklen_t len = sizeof(addr);
        if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            ::close(fd_);
            throw std::runtime_error("getsockname()");
        }
        port_ = ntohs(addr.sin_port);
    }

    ~LoopbackListener() { close(); }

    LoopbackListener(const LoopbackListener&) = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    void close() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

    [[nodiscard]] int fd() const { return fd_; }
    [[nodiscard]] std::string url() const { return "http://127.0.0.1:" + std::to_string(port_) + "/health"; }

private:
    int fd_{-1};
    uint16_t port_{0};
};

// Answers every request on the listener with a fixed HTTP response
class CannedHttpServer {
public:
    explicit CannedHttpServer(std::string response) : response_(std::move(response)) {
        worker_ = std::thread([this] { run(); });
    }

    ~CannedHttpServer() {
        stop_.store(true);
        if (worker_.joinable()) worker_.join();
    }

    [[nodiscard]] std::string url() const { return listener_.url(); }

private:
    void run() {
        pollfd pfd{listener_.fd(), POLLIN, 0};
        while (!stop_.load()) {
            if (::poll(&pfd, 1, 50) <= 0) continue;

            const int cfd = ::accept(listener_.fd(), nullptr, nullptr);
            if (cfd < 0) continue;

            std::string request;
            char buf[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                const ssize_t n = ::recv(cfd, buf, sizeof(buf), 0);
                if (n <= 0) break;
                request.append(buf, static_cast<size_t>(n));
            }

            const ssize_t sent = ::send(cfd, response_.data(), response_.size(), MSG_NOSIGNAL);
            (void)sent;
            ::close(cfd);
        }
    }

    LoopbackListener listener_;
    std::string response_;
    std::atomic<bool> stop_{false};
    std::thread worker_;
};

class HttpProberTest : public ::testing::Test {
protected:
    HttpProber prober;

    void SetUp() override {
        // Loopback traffic must not be routed through an ambient proxy
        ::setenv("NO_PROXY", "127.0.0.1", 1);
        ::setenv("no_proxy", "127.0.0.1", 1);
    }
};

}

TEST_F(HttpProberTest, SilentListenerTimesOut) {
    // The kernel completes the handshake but nobody ever answers
    LoopbackListener listener;

    const auto timeout = 300ms;
    const auto begin = std::chrono::steady_clock::now();
    const auto out = prober.probe(listener.url(), timeout);
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_TRUE(std::holds_alternative<outcome::Timeout>(out)) << describe(out);
    EXPECT_LT(elapsed, timeout + 1500ms);
    EXPECT_FALSE(statusCode(out).has_value());
}

TEST_F(HttpProberTest, ClosedPortIsConnectionFailure) {
    std::string url;
    {
        LoopbackListener listener;
        url = listener.url();
    }

    const auto out = prober.probe(url, 1s);
    ASSERT_TRUE(std::holds_alternative<outcome::ConnectionFailed>(out)) << describe(out);
    EXPECT_FALSE(std::get<outcome::ConnectionFailed>(out).detail.empty());
}

TEST_F(HttpProberTest, ServiceUnavailableIsUnexpectedStatus) {
    CannedHttpServer server("HTTP/1.1 503 Service Unavailable\r\n"
                            "Content-Length: 0\r\n"
                            "Connection: close\r\n\r\n");

    const auto out = prober.probe(server.url(), 2s);
    ASSERT_TRUE(std::holds_alternative<outcome::UnexpectedStatus>(out)) << describe(out);
    EXPECT_EQ(std::get<outcome::UnexpectedStatus>(out).status_code, 503);
    EXPECT_EQ(statusCode(out), 503);
}

TEST_F(HttpProberTest, NoContentIsSuccess) {
    CannedHttpServer server("HTTP/1.1 204 No Content\r\n"
                            "Connection: close\r\n\r\n");

    const auto out = prober.probe(server.url(), 2s);
    ASSERT_TRUE(std::holds_alternative<outcome::Success>(out)) << describe(out);
    EXPECT_EQ(std::get<outcome::Success>(out).status_code, 204);
    EXPECT_GE(responseTimeMs(out).value_or(-1.0), 0.0);
}
