#pragma once

#include "concurrency/AsyncService.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace tw::protocols::command { class Router; }

namespace tw::protocols::ctl {

// Local control socket: one framed request, one framed reply per connection.
class Server final : public concurrency::AsyncService {
public:
    static constexpr std::chrono::milliseconds DEFAULT_CLIENT_TIMEOUT{5000};

    // A client gets `clientTimeout` to deliver its request and take the reply.
    Server(std::shared_ptr<command::Router> router, std::string socketPath,
           std::chrono::milliseconds clientTimeout = DEFAULT_CLIENT_TIMEOUT);
    ~Server() override;

    // Binds on the caller's thread so socket errors surface here.
    void start() override;

    [[nodiscard]] const std::string& socketPath() const noexcept { return socketPath_; }

protected:
    void runLoop() override;
    void onStop() override;   // close listener to break accept()

private:
    std::shared_ptr<command::Router> router_;
    std::string socketPath_;
    std::chrono::milliseconds clientTimeout_;
    std::atomic<int> listenFd_{-1};

    void bindListener();
    void closeListener();
    void serve(int cfd) const;
    [[nodiscard]] bool awaitRequest(int cfd) const;
};

}
