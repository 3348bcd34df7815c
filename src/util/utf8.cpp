#include "util/utf8.hpp"

namespace sn::util::utf8 {

namespace {

constexpr bool isContinuation(const unsigned char b) { return (b & 0xC0) == 0x80; }

// Returns the sequence length announced by a lead byte, 0 for bytes that can never lead.
constexpr std::size_t sequenceLength(const unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

void appendCodePoint(std::string& out, const char32_t cp) {
    if (isEscapedByte(cp)) {
        out.push_back(static_cast<char>(cp - ESCAPE_BASE));
    } else if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

}

std::u32string decode(const std::string_view bytes) {
    std::u32string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        const auto len = sequenceLength(lead);

        if (len == 1) {
            out.push_back(lead);
            ++i;
            continue;
        }

        bool valid = len != 0 && i + len <= bytes.size();
        char32_t cp = 0;

        if (valid) {
            cp = lead & (0xFF >> (len + 1));
            for (std::size_t k = 1; k < len; ++k) {
                const auto b = static_cast<unsigned char>(bytes[i + k]);
                if (!isContinuation(b)) {
                    valid = false;
                    break;
                }
                cp = (cp << 6) | (b & 0x3F);
            }
        }

        // Reject overlong forms, surrogates and anything past U+10FFFF
        if (valid) {
            if ((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) valid = false;
            else if (cp >= 0xD800 && cp <= 0xDFFF) valid = false;
            else if (cp > 0x10FFFF) valid = false;
        }

        if (!valid) {
            out.push_back(ESCAPE_BASE + lead);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += len;
    }

    return out;
}

std::string encode(const std::u32string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const auto cp : text) appendCodePoint(out, cp);
    return out;
}

std::size_t length(const std::string_view bytes) {
    return decode(bytes).size();
}

}
