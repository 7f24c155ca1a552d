#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "health/Prober.hpp"
#include "provider/Adapter.hpp"
#include "provider/Factory.hpp"
#include "protocols/command/Router.hpp"
#include "protocols/ctl/Server.hpp"
#include "runtime/Context.hpp"
#include "runtime/Controller.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <curl/curl.h>
#include <fmt/core.h>
#include <thread>

using namespace tw;
using namespace tw::config;

namespace {
std::atomic_bool shouldExit = false;
std::atomic_bool reopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}

health::model::CheckConfig checkConfigFor(const EndpointEntry& e, const HealthCheckDefaults& d) {
    health::model::CheckConfig c;
    c.expected_status = e.expected_status.value_or(d.expected_status);
    c.timeout = e.timeout.value_or(d.timeout);
    c.poll_interval = e.interval.value_or(d.interval);
    c.failure_threshold = e.failure_threshold.value_or(d.failure_threshold);
    return c;
}
}

int main(const int argc, char** argv) {
    try {
        if (argc > 1) ConfigRegistry::init(std::filesystem::path(argv[1]));
        else ConfigRegistry::init();
        log::Registry::init();
    } catch (const std::exception& e) {
        fmt::print(stderr, "[-] Failed to load configuration: {}\n", e.what());
        return EXIT_FAILURE;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        log::Registry::trafficwarden()->critical("[-] curl_global_init failed");
        return EXIT_FAILURE;
    }

    int rc = EXIT_SUCCESS;

    try {
        const auto& cnf = ConfigRegistry::get();
        log::Registry::trafficwarden()->info("[*] Starting trafficwarden {} with {}",
                                             runtime::Controller::VERSION, ConfigRegistry::source().string());
        log::Registry::trafficwarden()->debug("[*] Effective configuration:\n{}", to_yaml(cnf));

        const auto prober = std::make_shared<health::HttpProber>(cnf.monitor.user_agent);
        const auto adapter = provider::makeAdapter(cnf.provider, cnf.monitor.user_agent);
        log::Registry::trafficwarden()->info("[*] Provider adapter: {}", adapter->name());

        const auto controller = std::make_shared<runtime::Controller>(runtime::Context::make(prober, adapter),
                                                                      runtime::Controller::optionsFrom(cnf));

        for (const auto& e : cnf.endpoints) {
            const auto res = controller->registerEndpoint(e.url, checkConfigFor(e, cnf.health_check_defaults));
            if (!res.ok) log::Registry::trafficwarden()->warn("[!] Skipping configured endpoint '{}': {}", e.url, res.message);
        }

        std::unique_ptr<protocols::ctl::Server> ctlServer;
        if (cnf.control.enabled) {
            ctlServer = std::make_unique<protocols::ctl::Server>(
                std::make_shared<protocols::command::Router>(controller), cnf.control.socket_path,
                std::chrono::milliseconds(cnf.control.client_timeout_ms));
            ctlServer->start();
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);
        std::signal(SIGPIPE, SIG_IGN);

        log::Registry::trafficwarden()->info("[✓] trafficwarden running");

        while (!shouldExit) {
            if (reopenLogs.exchange(false)) {
                log::Registry::reopenMainLog();
                log::Registry::reopenAuditLog();
                log::Registry::trafficwarden()->info("[*] Log files reopened");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        log::Registry::trafficwarden()->info("[*] Shutting down trafficwarden...");
        if (ctlServer) ctlServer->stop();
        controller->stopMonitoring();
        log::Registry::trafficwarden()->info("[✓] trafficwarden shut down cleanly.");
    } catch (const std::exception& e) {
        log::Registry::trafficwarden()->error("[-] Fatal: {}", e.what());
        rc = EXIT_FAILURE;
    }

    curl_global_cleanup();
    return rc;
}
