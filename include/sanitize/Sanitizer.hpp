#pragma once

#include "sanitize/charmap.hpp"

#include <string>
#include <vector>

namespace sn::sanitize {

enum class Mode {
    Unicode,  // each restricted character gets its own visual analogue
    Override  // every restricted character collapses to one substitute
};

struct Options {
    Mode mode = Mode::Unicode;
    char32_t replaceChar = DEFAULT_RESERVED_PREFIX;  // only read in Override mode
    std::size_t maxLength = DEFAULT_MAX_NAME_LENGTH;

    static Options unicode(std::size_t maxLength = DEFAULT_MAX_NAME_LENGTH);
    static Options withReplacement(char32_t replaceChar, std::size_t maxLength = DEFAULT_MAX_NAME_LENGTH);

    [[nodiscard]] char32_t reservedPrefix() const;
};

struct Result {
    std::string name;
    std::vector<std::string> issues;
};

/// Validates a user-supplied substitute character: exactly one code point that is
/// not itself restricted. Throws std::invalid_argument with a printable message.
char32_t parseReplaceChar(const std::string& utf8);

// Individual pipeline stages. Each appends its issues, if any, to `issues`.
std::u32string replaceForbiddenChars(const std::u32string& name, const Options& opts, std::vector<std::string>& issues);
std::u32string handleTrailingDotsSpaces(const std::u32string& name, const Options& opts, std::vector<std::string>& issues);
std::u32string handleReservedNames(const std::u32string& name, const Options& opts, std::vector<std::string>& issues);
std::u32string truncateName(const std::u32string& name, std::size_t maxLength, std::vector<std::string>& issues);

[[nodiscard]] bool isReservedDeviceName(const std::u32string& stem);

/// Runs the full pipeline on one file or directory name (UTF-8).
/// Total: never throws, whatever bytes the name holds.
Result sanitizeName(const std::string& name, const Options& opts = {});

[[nodiscard]] bool isNameSafe(const std::string& name, const Options& opts = {});

}
