#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace sn::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels taken from the config registry.
    static void init();
    static void init(const config::LoggingConfig& cfg);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> safename() { return get("safename"); }
    static std::shared_ptr<spdlog::logger> sanitize() { return get("sanitize"); }
    static std::shared_ptr<spdlog::logger> planner()  { return get("planner"); }
    static std::shared_ptr<spdlog::logger> executor() { return get("executor"); }
    static std::shared_ptr<spdlog::logger> shell()    { return get("shell"); }
    static std::shared_ptr<spdlog::logger> config()   { return get("config"); }
    static std::shared_ptr<spdlog::logger> audit()    { return get("audit"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const auto* AUDIT_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;

    // stdout is reserved for the plan report, so the console sink writes to stderr
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt>    audit_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
