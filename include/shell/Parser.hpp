#pragma once

#include "shell/Token.hpp"
#include "shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sn::shell {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

inline const FlagSpec* findSpec(const std::vector<FlagSpec>& specs, const std::string& key) {
    for (const auto& spec : specs) {
        if (spec.name == key) return &spec;
        for (const auto& alias : spec.aliases) if (alias == key) return &spec;
    }
    return nullptr;
}

inline CommandCall parseTokens(const std::vector<Token>& toks, const std::vector<FlagSpec>& specs) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(4);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (t.type == TokenType::Value) {
            // Orphan "=value" with no flag in front of it; keep it positional
            call.positionals.push_back(t.text);
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const auto* spec = findSpec(specs, t.text);
            if (!spec) {
                call.unknown.push_back(t.text);
                if (i + 1 < toks.size() && toks[i+1].type == TokenType::Value) ++i;
                continue;
            }

            if (i + 1 < toks.size() && toks[i+1].type == TokenType::Value) {
                setOpt(call, spec->name, toks[i+1].text);
                ++i;
            } else if (spec->takes_value && i + 1 < toks.size() && toks[i+1].type == TokenType::Word &&
                       toks[i+1].text != "--") {
                setOpt(call, spec->name, toks[i+1].text);
                ++i; // consumed value
            } else {
                setOpt(call, spec->name, std::nullopt);
            }
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

}
