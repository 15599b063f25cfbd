/**
 * @file test_utf8.cpp
 * @brief UTF-8 解码与比较规范化测试
 */

#include <gtest/gtest.h>
#include "common/utf8.h"

using namespace multiocr;

TEST(Utf8, DecodesMultiByteSequences) {
    EXPECT_EQ(Utf8::decode("abc"), U"abc");
    EXPECT_EQ(Utf8::decode("\xC3\xA9"), U"é");           // é
    EXPECT_EQ(Utf8::decode("\xE4\xB8\xAD"), U"中");       // 中
    EXPECT_EQ(Utf8::decode("\xF0\x9F\x98\x80").size(), 1u);   // emoji
}

/**
 * @brief 非法字节原样保留, 长度保持确定
 */
TEST(Utf8, InvalidBytesPassThrough) {
    std::u32string decoded = Utf8::decode("a\xFF" "b");
    ASSERT_EQ(decoded.size(), 3u);
    EXPECT_EQ(decoded[1], char32_t(0xFF));

    // Truncated sequence at the end
    EXPECT_EQ(Utf8::decode("\xE4\xB8").size(), 2u);
}

TEST(Utf8, NormalizeTrimsAndLowercases) {
    EXPECT_EQ(Utf8::normalizeForComparison("  Invoice 100\n"), U"invoice 100");
    EXPECT_EQ(Utf8::normalizeForComparison("\xE3\x80\x80" "ABC"), U"abc");   // ideographic space
    EXPECT_EQ(Utf8::normalizeForComparison(""), U"");
}

TEST(Utf8, UnicodeSpaces) {
    EXPECT_TRUE(Utf8::isSpace(U' '));
    EXPECT_TRUE(Utf8::isSpace(char32_t(0x00A0)));
    EXPECT_TRUE(Utf8::isSpace(char32_t(0x3000)));
    EXPECT_FALSE(Utf8::isSpace(U'x'));
}
