#pragma once

#include <string>
#include <string_view>

namespace sn::util::utf8 {

// Bytes that are not part of a well-formed sequence decode to U+DC00 + byte
// and encode back to the same raw byte, so decode/encode round-trips any name.
constexpr char32_t ESCAPE_BASE = 0xDC00;

std::u32string decode(std::string_view bytes);
std::string encode(std::u32string_view text);

// Length in code points.
std::size_t length(std::string_view bytes);

[[nodiscard]] inline bool isEscapedByte(const char32_t cp) { return cp >= 0xDC80 && cp <= 0xDCFF; }

}
