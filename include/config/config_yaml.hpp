#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sn::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<SanitizeConfig> {
    static Node encode(const SanitizeConfig& rhs) {
        Node node;
        node["replace_char"] = rhs.replace_char;
        node["max_length"] = rhs.max_length;
        node["follow_symlinks"] = rhs.follow_symlinks;
        return node;
    }

    static bool decode(const Node& node, SanitizeConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.replace_char = node["replace_char"].as<std::string>("");
        rhs.max_length = node["max_length"].as<std::size_t>(sn::sanitize::DEFAULT_MAX_NAME_LENGTH);
        rhs.follow_symlinks = node["follow_symlinks"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<ExecutionConfig> {
    static Node encode(const ExecutionConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        return node;
    }

    static bool decode(const Node& node, ExecutionConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(".");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["safename"] = to_std_string(spdlog::level::to_string_view(rhs.safename));
        node["sanitize"] = to_std_string(spdlog::level::to_string_view(rhs.sanitize));
        node["planner"]  = to_std_string(spdlog::level::to_string_view(rhs.planner));
        node["executor"] = to_std_string(spdlog::level::to_string_view(rhs.executor));
        node["shell"]    = to_std_string(spdlog::level::to_string_view(rhs.shell));
        node["config"]   = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const SubsystemLogLevelsConfig def;
        rhs.safename = levelOr(node["safename"], def.safename);
        rhs.sanitize = levelOr(node["sanitize"], def.sanitize);
        rhs.planner  = levelOr(node["planner"], def.planner);
        rhs.executor = levelOr(node["executor"], def.executor);
        rhs.shell    = levelOr(node["shell"], def.shell);
        rhs.config   = levelOr(node["config"], def.config);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        const LogLevelsConfig def;
        rhs.console_log_level = levelOr(node["console_log_level"], def.console_log_level);
        rhs.file_log_level = levelOr(node["file_log_level"], def.file_log_level);
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
