#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace sn::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct FlagSpec {
    std::string name;                  // canonical long name, no dashes
    std::vector<std::string> aliases;  // e.g. {"y"}
    bool takes_value = false;
};

struct CommandCall {
    std::string name;                       // program name as invoked
    std::vector<FlagKV> options;            // canonical keys, last one wins
    std::vector<std::string> positionals;
    std::vector<std::string> unknown;       // flags no FlagSpec claimed

    [[nodiscard]] bool hasFlag(const std::string& key) const {
        for (const auto& [k, v] : options) if (k == key) return true;
        return false;
    }

    [[nodiscard]] std::optional<std::string> optVal(const std::string& key) const {
        for (const auto& [k, v] : options) if (k == key) return v;
        return std::nullopt;
    }
};

struct StreamIO {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
};

}
