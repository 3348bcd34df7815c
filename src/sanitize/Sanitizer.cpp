#include "sanitize/Sanitizer.hpp"
#include "util/utf8.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <set>
#include <stdexcept>
#include <string_view>

using namespace sn::util;

namespace sn::sanitize {

namespace {

constexpr unsigned int MAX_SETTLE_PASSES = 8;

constexpr std::array<std::string_view, 4> RESERVED_NAMES = {"CON", "PRN", "AUX", "NUL"};
constexpr std::array<std::string_view, 2> RESERVED_NUMBERED_PREFIXES = {"COM", "LPT"};

bool isTrailingStrippable(const char32_t c) { return c == U'.' || c == U' '; }

std::string quoted(const std::u32string& text) { return "'" + utf8::encode(text) + "'"; }

}

Options Options::unicode(const std::size_t maxLength) {
    return {Mode::Unicode, DEFAULT_RESERVED_PREFIX, maxLength};
}

Options Options::withReplacement(const char32_t replaceChar, const std::size_t maxLength) {
    return {Mode::Override, replaceChar, maxLength};
}

char32_t Options::reservedPrefix() const {
    return mode == Mode::Override ? replaceChar : DEFAULT_RESERVED_PREFIX;
}

char32_t parseReplaceChar(const std::string& text) {
    const auto decoded = utf8::decode(text);
    if (decoded.size() != 1 || utf8::isEscapedByte(decoded.front()))
        throw std::invalid_argument("replace character must be a single character, got '" + text + "'");

    if (isRestrictedChar(decoded.front())) {
        const auto shown = isControlChar(decoded.front())
                               ? fmt::format("0x{:02X}", static_cast<unsigned int>(decoded.front()))
                               : text;
        throw std::invalid_argument("replace character '" + shown + "' is itself a restricted character");
    }

    return decoded.front();
}

std::u32string replaceForbiddenChars(const std::u32string& name, const Options& opts,
                                     std::vector<std::string>& issues) {
    std::u32string out;
    out.reserve(name.size());

    std::set<char32_t> forbidden, control;

    for (const auto c : name) {
        if (!isRestrictedChar(c)) {
            out.push_back(c);
            continue;
        }

        if (isForbiddenChar(c)) forbidden.insert(c);
        else control.insert(c);

        out.push_back(opts.mode == Mode::Unicode ? *unicodeReplacement(c) : opts.replaceChar);
    }

    if (forbidden.empty() && control.empty()) return out;

    std::vector<std::string> parts;
    if (!forbidden.empty()) {
        std::vector<std::string> shown;
        for (const auto c : forbidden) shown.push_back(quoted(std::u32string(1, c)));
        parts.push_back(fmt::format("forbidden characters [{}]", fmt::join(shown, ", ")));
    }
    if (!control.empty()) {
        std::vector<std::string> codes;
        for (const auto c : control) codes.push_back(fmt::format("0x{:02X}", static_cast<unsigned int>(c)));
        parts.push_back(fmt::format("control characters [{}]", fmt::join(codes, ", ")));
    }

    issues.push_back(fmt::format("Replaced {}", fmt::join(parts, ", ")));
    return out;
}

std::u32string handleTrailingDotsSpaces(const std::u32string& name, const Options& opts,
                                        std::vector<std::string>& issues) {
    auto start = name.size();
    while (start > 0 && isTrailingStrippable(name[start - 1])) --start;
    if (start == name.size()) return name;

    const auto trailing = name.substr(start);
    auto result = name.substr(0, start);

    if (opts.mode == Mode::Override) {
        issues.push_back("Stripped trailing characters: " + quoted(trailing));
        if (result.empty()) {
            result.push_back(opts.replaceChar);
            issues.emplace_back("Name was empty after stripping; replaced with fallback character");
        }
        return result;
    }

    for (const auto c : trailing)
        result.push_back(c == U'.' ? UNICODE_DOT_REPLACEMENT : UNICODE_SPACE_REPLACEMENT);

    issues.push_back("Replaced trailing characters: " + quoted(trailing));
    return result;
}

bool isReservedDeviceName(const std::u32string& stem) {
    if (stem.size() != 3 && stem.size() != 4) return false;
    for (const auto c : stem)
        if (c >= 0x80) return false;

    const auto upper = boost::algorithm::to_upper_copy(utf8::encode(stem));

    if (upper.size() == 3) {
        for (const auto reserved : RESERVED_NAMES)
            if (upper == reserved) return true;
        return false;
    }

    if (upper[3] < '0' || upper[3] > '9') return false;
    const std::string_view prefix(upper.data(), 3);
    for (const auto reserved : RESERVED_NUMBERED_PREFIXES)
        if (prefix == reserved) return true;
    return false;
}

std::u32string handleReservedNames(const std::u32string& name, const Options& opts,
                                   std::vector<std::string>& issues) {
    // Windows matches the device name on everything before the first dot
    const auto dot = name.find(U'.');
    const auto stem = dot == std::u32string::npos ? name : name.substr(0, dot);

    if (!isReservedDeviceName(stem)) return name;

    issues.push_back("Reserved Windows device name: " + quoted(stem));
    return opts.reservedPrefix() + name;
}

std::u32string truncateName(const std::u32string& name, const std::size_t maxLength,
                            std::vector<std::string>& issues) {
    if (name.size() <= maxLength) return name;

    issues.push_back(fmt::format("Name length {} exceeds limit {}; truncated", name.size(), maxLength));

    // A leading dot alone does not make an extension
    const auto dot = name.rfind(U'.');
    if (dot == std::u32string::npos || dot == 0) return name.substr(0, maxLength);

    const auto ext = name.substr(dot);
    if (ext.size() >= maxLength) return name.substr(0, maxLength);

    return name.substr(0, maxLength - ext.size()) + ext;
}

Result sanitizeName(const std::string& name, const Options& opts) {
    Result res;

    auto text = utf8::decode(name);
    text = replaceForbiddenChars(text, opts, res.issues);
    text = handleTrailingDotsSpaces(text, opts, res.issues);
    text = handleReservedNames(text, opts, res.issues);
    auto truncated = truncateName(text, opts.maxLength, res.issues);

    // A cut can leave a trailing dot/space or a reserved stem behind; settle it
    for (unsigned int pass = 0; truncated != text && pass < MAX_SETTLE_PASSES; ++pass) {
        text = handleTrailingDotsSpaces(truncated, opts, res.issues);
        text = handleReservedNames(text, opts, res.issues);
        truncated = truncateName(text, opts.maxLength, res.issues);
    }

    res.name = utf8::encode(truncated);
    return res;
}

bool isNameSafe(const std::string& name, const Options& opts) {
    return sanitizeName(name, opts).name == name;
}

}
