#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/null_sink.h>

#include <filesystem>
#include <stdexcept>

namespace sn::logging {

void LogRegistry::init() {
    init(config::ConfigRegistry::get().logging);
}

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = cnf.log_dir;

    std::vector<spdlog::sink_ptr> mainSinks;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);
    mainSinks.push_back(console_sink_);

    if (!log_dir_.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (log_dir_ / "safename.log").string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        mainSinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, mainSinks.begin(), mainSinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("safename", sub_levels.safename);
    makeLogger("sanitize", sub_levels.sanitize);
    makeLogger("planner",  sub_levels.planner);
    makeLogger("executor", sub_levels.executor);
    makeLogger("shell",    sub_levels.shell);
    makeLogger("config",   sub_levels.config);

    // audit: file-only sink (append), swallowed when no log directory is configured
    {
        spdlog::sink_ptr sink;
        if (!log_dir_.empty()) {
            audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                (log_dir_ / "audit.log").string(), /*truncate=*/false);
            audit_file_sink_->set_pattern(AUDIT_FORMAT);
            sink = audit_file_sink_;
        } else {
            sink = std::make_shared<spdlog::sinks::null_sink_mt>();
        }
        const auto logger = std::make_shared<spdlog::logger>("audit", sink);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    safename()->debug("[LogRegistry] Initialized (log dir: {})", log_dir_.empty() ? "<none>" : log_dir_.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
