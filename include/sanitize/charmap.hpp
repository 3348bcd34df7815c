#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <utility>

namespace sn::sanitize {

constexpr std::size_t DEFAULT_MAX_NAME_LENGTH = 255;
constexpr std::size_t WINDOWS_MAX_PATH = 260;

// Windows-forbidden punctuation and their fullwidth counterparts.
constexpr std::array<std::pair<char32_t, char32_t>, 9> FORBIDDEN_CHAR_MAP = {{
    {U'\\', U'\uFF3C'}, // FULLWIDTH REVERSE SOLIDUS
    {U'/',  U'\uFF0F'}, // FULLWIDTH SOLIDUS
    {U':',  U'\uFF1A'}, // FULLWIDTH COLON
    {U'*',  U'\uFF0A'}, // FULLWIDTH ASTERISK
    {U'?',  U'\uFF1F'}, // FULLWIDTH QUESTION MARK
    {U'"',  U'\uFF02'}, // FULLWIDTH QUOTATION MARK
    {U'<',  U'\uFF1C'}, // FULLWIDTH LESS-THAN SIGN
    {U'>',  U'\uFF1E'}, // FULLWIDTH GREATER-THAN SIGN
    {U'|',  U'\uFF5C'}, // FULLWIDTH VERTICAL LINE
}};

// 0x00-0x1F map onto the Control Pictures block
constexpr char32_t CONTROL_PICTURES_BASE = 0x2400;
constexpr char32_t CONTROL_CHAR_LIMIT = 0x20;

constexpr char32_t UNICODE_DOT_REPLACEMENT = U'\uFF0E';   // FULLWIDTH FULL STOP
constexpr char32_t UNICODE_SPACE_REPLACEMENT = U'\u2420'; // SYMBOL FOR SPACE

constexpr char32_t DEFAULT_RESERVED_PREFIX = U'_';

constexpr std::size_t RESTRICTED_CHAR_COUNT = FORBIDDEN_CHAR_MAP.size() + CONTROL_CHAR_LIMIT;

constexpr bool isForbiddenChar(const char32_t c) {
    for (const auto& [from, to] : FORBIDDEN_CHAR_MAP)
        if (from == c) return true;
    return false;
}

constexpr bool isControlChar(const char32_t c) { return c < CONTROL_CHAR_LIMIT; }

constexpr bool isRestrictedChar(const char32_t c) { return isForbiddenChar(c) || isControlChar(c); }

// Unicode analogue of a restricted character, nullopt for anything else.
constexpr std::optional<char32_t> unicodeReplacement(const char32_t c) {
    if (isControlChar(c)) return CONTROL_PICTURES_BASE + c;
    for (const auto& [from, to] : FORBIDDEN_CHAR_MAP)
        if (from == c) return to;
    return std::nullopt;
}

// Every restricted character, in code point order.
constexpr std::array<char32_t, RESTRICTED_CHAR_COUNT> restrictedChars() {
    std::array<char32_t, RESTRICTED_CHAR_COUNT> out{};
    std::size_t i = 0;
    for (char32_t c = 0; c < 0x80; ++c)
        if (isRestrictedChar(c)) out[i++] = c;
    return out;
}

}
