#include "config.h"

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "util.h"

TEST(util_hex, hex_to_bytes_mixed_case) {
    EXPECT_EQ(std::string("\x0a\x0b\xff", 3), hex_to_bytes("0a0BfF"));
}

TEST(util_hex, hex_to_bytes_rejects_non_hex) {
    EXPECT_EQ("", hex_to_bytes("0a0g"));
}

TEST(util_hex, hex_to_bytes_odd_length_pads_first_byte) {
    EXPECT_EQ(std::string("\x01\x23", 2), hex_to_bytes("123"));
}

TEST(util_hex, bytes_to_hex_lowercase) {
    EXPECT_EQ("00ff7a", bytes_to_hex(std::string("\x00\xff\x7a", 3)));
}

TEST(util_hex, is_hex_str) {
    EXPECT_TRUE(is_hex_str("0123456789abcdefABCDEF"));
    EXPECT_TRUE(is_hex_str(""));
    EXPECT_FALSE(is_hex_str("00:11"));
}

TEST(util_hex, x_to_i) {
    EXPECT_EQ(0, x_to_i('0'));
    EXPECT_EQ(10, x_to_i('a'));
    EXPECT_EQ(15, x_to_i('F'));
    EXPECT_EQ(-1, x_to_i('g'));
    EXPECT_EQ(-1, x_to_i(':'));
}

TEST(util_text, latin1_to_utf8) {
    EXPECT_EQ("plain", latin1_to_utf8("plain"));
    EXPECT_EQ("caf\xc3\xa9", latin1_to_utf8("caf\xe9"));
    EXPECT_EQ("\xc3\xbf", latin1_to_utf8("\xff"));
}

TEST(util_text, is_valid_utf8) {
    EXPECT_TRUE(is_valid_utf8("caf\xc3\xa9"));
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_FALSE(is_valid_utf8("caf\xe9"));
    EXPECT_FALSE(is_valid_utf8("\xc3"));
}

TEST(util_text, utf8_sanitize) {
    EXPECT_EQ("caf\xc3\xa9", utf8_sanitize("caf\xc3\xa9"));
    EXPECT_EQ("", utf8_sanitize(""));

    // Bad lead byte
    EXPECT_EQ("\xef\xbf\xbd" "a", utf8_sanitize("\xff" "a"));

    // Truncated 3 byte sequence is one replacement
    EXPECT_EQ("\xef\xbf\xbd" "a", utf8_sanitize("\xe2\x82" "a"));
    EXPECT_EQ("x\xef\xbf\xbd", utf8_sanitize("x\xe2\x82"));

    // Overlong and surrogate forms replace per byte
    EXPECT_EQ("\xef\xbf\xbd\xef\xbf\xbd", utf8_sanitize("\xc0\xaf"));
    EXPECT_EQ("\xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd", utf8_sanitize("\xed\xa0\x80"));

    // 4 byte sequence kept
    EXPECT_EQ("\xf0\x9f\x98\x80", utf8_sanitize("\xf0\x9f\x98\x80"));
}

TEST(util_text, munge_to_printable) {
    EXPECT_EQ("wing", munge_to_printable("wing"));
    EXPECT_EQ("a\\nb", munge_to_printable("a\nb"));
    EXPECT_EQ("\\xE9", munge_to_printable("\xe9"));
}

TEST(util_text, str_strip) {
    EXPECT_EQ("a b", str_strip(" \ta b\r\n"));
    EXPECT_EQ("", str_strip(" \t "));
}

TEST(util_text, str_lower) {
    EXPECT_EQ("output", str_lower("OutPut"));
}

TEST(util_text, str_tokenize_collapses_separators) {
    auto t = str_tokenize("00:11:22:33:44:55  ie=00\tx", " \t");

    ASSERT_EQ(3u, t.size());
    EXPECT_EQ("00:11:22:33:44:55", t[0]);
    EXPECT_EQ("ie=00", t[1]);
    EXPECT_EQ("x", t[2]);
}

TEST(util_text, string_to_bool) {
    EXPECT_EQ(1, string_to_bool("true"));
    EXPECT_EQ(1, string_to_bool("T"));
    EXPECT_EQ(0, string_to_bool("false"));
    EXPECT_EQ(-1, string_to_bool("maybe"));
    EXPECT_EQ(5, string_to_bool("", 5));
}

