#include "plan/Collisions.hpp"
#include "util/utf8.hpp"

#include <fmt/format.h>

#include <stdexcept>

using namespace sn::util;

namespace sn::plan {

namespace {

constexpr unsigned long MAX_DISAMBIGUATOR = 1'000'000;

std::u32string ascii(const std::string& s) { return {s.begin(), s.end()}; }

std::u32string disambiguate(const std::u32string& stem, const std::u32string& ext,
                            const unsigned long counter, const std::size_t maxLength) {
    const auto suffix = ascii(fmt::format("_{}", counter));

    if (maxLength >= ext.size() + suffix.size() + 1) {
        const auto maxStem = maxLength - ext.size() - suffix.size();
        return stem.substr(0, maxStem) + suffix + ext;
    }

    // Extension and suffix alone do not fit: drop the extension, keep the suffix
    if (suffix.size() >= maxLength) return suffix.substr(suffix.size() - maxLength);
    return stem.substr(0, maxLength - suffix.size()) + suffix;
}

}

std::string findAvailableName(const std::string& desired, const NameSet& taken, const std::size_t maxLength) {
    if (!taken.contains(desired)) return desired;

    const auto name = utf8::decode(desired);
    const auto dot = name.rfind(U'.');

    std::u32string stem = name, ext;
    if (dot != std::u32string::npos && dot > 0) {
        stem = name.substr(0, dot);
        ext = name.substr(dot);
    }

    for (unsigned long counter = 1; counter <= MAX_DISAMBIGUATOR; ++counter) {
        auto candidate = utf8::encode(disambiguate(stem, ext, counter, maxLength));
        if (!taken.contains(candidate)) return candidate;
    }

    throw std::length_error("No free name for '" + desired + "' within " + std::to_string(maxLength) + " characters");
}

CollisionResolution resolveCollisions(const std::map<std::string, std::string>& planned,
                                      const NameSet& untouched,
                                      const std::size_t maxLength) {
    NameSet taken(untouched);
    CollisionResolution result;

    for (const auto& [original, desired] : planned) {
        try {
            auto chosen = findAvailableName(desired, taken, maxLength);
            taken.insert(chosen);
            result.names.emplace(original, std::move(chosen));
        } catch (const std::length_error&) {
            result.unresolved.push_back(original);
        }
    }

    return result;
}

}
