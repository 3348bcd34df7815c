#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace sn::config {

sanitize::Options SanitizeConfig::toOptions() const {
    if (replace_char.empty()) return sanitize::Options::unicode(max_length);
    return sanitize::Options::withReplacement(sanitize::parseReplaceChar(replace_char), max_length);
}

void validate(const Config& cfg) {
    if (cfg.sanitize.max_length == 0)
        throw std::invalid_argument("sanitize.max_length must be a positive integer");
    if (!cfg.sanitize.replace_char.empty()) (void)sanitize::parseReplaceChar(cfg.sanitize.replace_char);
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["sanitize"]) YAML::convert<SanitizeConfig>::decode(node, cfg.sanitize);
    if (auto node = root["execution"]) YAML::convert<ExecutionConfig>::decode(node, cfg.execution);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    validate(cfg);
    return cfg;
}

}
