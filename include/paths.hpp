#pragma once

#include <cstdlib>
#include <filesystem>

namespace sn::paths {

inline std::filesystem::path getConfigPath() {
    if (const char* explicitPath = std::getenv("SAFENAME_CONFIG"); explicitPath && *explicitPath)
        return explicitPath;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "safename" / "config.yaml";
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "safename" / "config.yaml";
    return "/etc/safename/config.yaml";
}

}
