#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace tw::log {

void Registry::init() {
    init(config::ConfigRegistry::get().logging);
}

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = cnf.log_dir;
    main_log_path_  = log_dir_ / "trafficwarden.log";
    audit_log_path_ = log_dir_ / "audit.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name,
                          const spdlog::level::level_enum lvl = spdlog::level::debug) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("trafficwarden", sub_levels.trafficwarden);
    makeLogger("monitor",       sub_levels.monitor);
    makeLogger("probe",         sub_levels.probe);
    makeLogger("failover",      sub_levels.failover);
    makeLogger("traffic",       sub_levels.traffic);
    makeLogger("scaling",       sub_levels.scaling);
    makeLogger("alerts",        sub_levels.alerts);
    makeLogger("provider",      sub_levels.provider);
    makeLogger("shell",         sub_levels.shell);

    // audit: file-only sink (append)
    {
        audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            audit_log_path_.string(), /*truncate=*/false);
        std::vector<spdlog::sink_ptr> sinks = { audit_file_sink_ };
        const auto logger = std::make_shared<spdlog::logger>("audit", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    trafficwarden()->debug("[LogRegistry] Initialized, writing to {}", log_dir_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::replaceSinkEverywhere_(
    const std::shared_ptr<spdlog::sinks::sink>& old_sink,
    const std::shared_ptr<spdlog::sinks::sink>& new_sink)
{
    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        // Replace in a copy, then swap the whole vector in.
        auto sinks_copy = lg->sinks();
        bool touched = false;
        for (auto &s : sinks_copy) {
            if (s.get() == old_sink.get()) {
                s = new_sink;
                touched = true;
            }
        }
        if (touched) {
            lg->flush();
            lg->sinks() = std::move(sinks_copy);
        }
    });
}

void Registry::reopenMainLog() {
    if (!initialized_) return;

    auto fresh = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);

    fresh->set_level(main_file_sink_->level());
    fresh->set_pattern(LOG_FORMAT);

    replaceSinkEverywhere_(main_file_sink_, fresh);
    main_file_sink_ = std::move(fresh);
}

void Registry::reopenAuditLog() {
    if (!initialized_) return;

    auto fresh = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        audit_log_path_.string(), /*truncate=*/false);
    fresh->set_level(audit_file_sink_->level());

    replaceSinkEverywhere_(audit_file_sink_, fresh);
    audit_file_sink_ = std::move(fresh);
}

}
