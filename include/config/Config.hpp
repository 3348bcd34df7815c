#pragma once

#include "sanitize/Sanitizer.hpp"

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace sn::config {

struct SanitizeConfig {
    std::string replace_char;  // empty: Unicode-substitution mode
    std::size_t max_length = sanitize::DEFAULT_MAX_NAME_LENGTH;
    bool follow_symlinks = false;

    [[nodiscard]] sanitize::Options toOptions() const;
};

struct ExecutionConfig {
    std::filesystem::path log_dir = ".";  // where rename_log_<timestamp>.json lands
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum safename = spdlog::level::info;  // startup, top-level failures
    spdlog::level::level_enum sanitize = spdlog::level::warn;  // per-name rewrites at debug
    spdlog::level::level_enum planner  = spdlog::level::warn;  // unreadable directories, scan summaries at info
    spdlog::level::level_enum executor = spdlog::level::info;  // one line per rename attempt
    spdlog::level::level_enum shell    = spdlog::level::warn;  // argument errors
    spdlog::level::level_enum config   = spdlog::level::warn;  // missing or odd config files
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    SanitizeConfig sanitize;
    ExecutionConfig execution;
    LoggingConfig logging;
};

/// Parses a YAML config file. Sections that are absent keep their defaults.
/// Throws YAML::Exception on malformed YAML and std::invalid_argument on
/// values the sanitizer cannot work with.
Config loadConfig(const std::filesystem::path& path);

void validate(const Config& cfg);

}
