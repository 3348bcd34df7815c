#include <gtest/gtest.h>
#include "util/utf8.hpp"

using namespace sn::util;

TEST(Utf8Test, DecodesMultiByteSequences) {
    const auto decoded = utf8::decode("a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");  // a é € 😀
    ASSERT_EQ(decoded.size(), 4u);
    EXPECT_EQ(decoded[0], U'a');
    EXPECT_EQ(decoded[1], char32_t{0xE9});
    EXPECT_EQ(decoded[2], char32_t{0x20AC});
    EXPECT_EQ(decoded[3], char32_t{0x1F600});
}

TEST(Utf8Test, LengthCountsCodePointsNotBytes) {
    EXPECT_EQ(utf8::length("\xEF\xBC\x9A"), 1u);  // U+FF1A
    EXPECT_EQ(utf8::length("abc"), 3u);
    EXPECT_EQ(utf8::length(""), 0u);
}

TEST(Utf8Test, InvalidBytesAreEscapedAndRestored) {
    const std::string raw = "bad\xFF\xC3name\x80";
    const auto decoded = utf8::decode(raw);

    ASSERT_EQ(decoded.size(), raw.size());
    EXPECT_TRUE(utf8::isEscapedByte(decoded[3]));
    EXPECT_EQ(decoded[3], utf8::ESCAPE_BASE + 0xFF);
    EXPECT_TRUE(utf8::isEscapedByte(decoded[4]));
    EXPECT_EQ(utf8::encode(decoded), raw);
}

TEST(Utf8Test, OverlongAndSurrogateFormsAreRejected) {
    // overlong '/' and an encoded U+D800
    for (const std::string raw : {std::string("\xE0\x80\xAF"), std::string("\xED\xA0\x80")}) {
        const auto decoded = utf8::decode(raw);
        ASSERT_EQ(decoded.size(), 3u) << raw;
        for (const auto cp : decoded) EXPECT_TRUE(utf8::isEscapedByte(cp));
        EXPECT_EQ(utf8::encode(decoded), raw);
    }
}

TEST(Utf8Test, TruncatedSequenceAtEndIsEscaped) {
    const std::string raw = "x\xE2\x82";
    const auto decoded = utf8::decode(raw);
    ASSERT_EQ(decoded.size(), 3u);
    EXPECT_EQ(decoded[0], U'x');
    EXPECT_EQ(utf8::encode(decoded), raw);
}
