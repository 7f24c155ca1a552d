#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace tw::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        interruptFlag_.store(true, std::memory_order_release);
        worker_.join();
    }
}

void AsyncService::start() {
    if (isRunning()) return;

    // A previous run may have ended on its own; reap it before reuse.
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::trafficwarden()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::trafficwarden()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!isRunning() && !worker_.joinable()) return;

    log::Registry::trafficwarden()->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true, std::memory_order_release);
    onStop();

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
    }

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    log::Registry::trafficwarden()->info("[{}] Service stopped.", serviceName_);
}
