#include <gtest/gtest.h>
#include "marquee/core/string.hpp"

using namespace marquee;

// ============================================================================
// Unicode Tests
// ============================================================================

TEST(UnicodeTest, IsValid) {
    EXPECT_TRUE(unicode::is_valid(0x41));
    EXPECT_TRUE(unicode::is_valid(0x10FFFF));
    EXPECT_FALSE(unicode::is_valid(0xD800));
    EXPECT_FALSE(unicode::is_valid(0x110000));
}

TEST(UnicodeTest, Whitespace) {
    EXPECT_TRUE(unicode::is_whitespace(' '));
    EXPECT_TRUE(unicode::is_whitespace('\t'));
    EXPECT_TRUE(unicode::is_whitespace(0x00A0));
    EXPECT_TRUE(unicode::is_whitespace(0x3000));
    EXPECT_FALSE(unicode::is_whitespace('A'));
    EXPECT_FALSE(unicode::is_whitespace(0x200B));
}

TEST(UnicodeTest, ToUpper) {
    EXPECT_EQ(unicode::to_upper('a'), U'A');
    EXPECT_EQ(unicode::to_upper('Z'), U'Z');
    EXPECT_EQ(unicode::to_upper(0xE9), 0xC9u);  // e acute
    EXPECT_EQ(unicode::to_upper(0xF7), 0xF7u);  // division sign
    EXPECT_EQ(unicode::to_upper(0x4E2D), 0x4E2Du);
}

TEST(UnicodeTest, ReaderWalksMixedWidths) {
    unicode::Utf8Reader reader("A\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80");
    EXPECT_EQ(reader.next(), U'A');
    EXPECT_EQ(reader.offset(), 1u);
    EXPECT_EQ(reader.next(), 0xE9u);
    EXPECT_EQ(reader.offset(), 3u);
    EXPECT_EQ(reader.next(), 0x4E2Du);
    EXPECT_EQ(reader.next(), 0x1F600u);
    EXPECT_TRUE(reader.at_end());
}

TEST(UnicodeTest, MalformedBecomesReplacement) {
    // stray continuation, overlong '/', surrogate, truncated tail
    auto cps = decode_utf8("\x80" "\xC0\xAF" "\xED\xA0\x80" "x" "\xE4\xB8");
    const std::vector<unicode::CodePoint> expected = {
        unicode::REPLACEMENT_CHARACTER,
        unicode::REPLACEMENT_CHARACTER, unicode::REPLACEMENT_CHARACTER,
        unicode::REPLACEMENT_CHARACTER,
        U'x',
        unicode::REPLACEMENT_CHARACTER,
    };
    EXPECT_EQ(cps, expected);
}

TEST(UnicodeTest, BrokenSequenceResumesAtNextLead) {
    // lead byte of a 3-byte sequence followed directly by ASCII
    auto cps = decode_utf8("\xE4ok");
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[0], unicode::REPLACEMENT_CHARACTER);
    EXPECT_EQ(cps[1], U'o');
    EXPECT_EQ(cps[2], U'k');
}

TEST(UnicodeTest, AppendUtf8Widths) {
    std::string out;
    append_utf8(out, U'A');
    EXPECT_EQ(out.size(), 1u);
    append_utf8(out, 0xE9);
    EXPECT_EQ(out.size(), 3u);
    append_utf8(out, 0x4E2D);
    EXPECT_EQ(out.size(), 6u);
    append_utf8(out, 0x1F600);
    EXPECT_EQ(out, "A\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80");
}

TEST(UnicodeTest, AppendInvalidWritesReplacement) {
    std::string out;
    append_utf8(out, 0x110000);
    append_utf8(out, 0xDC00);
    EXPECT_EQ(out, "\xEF\xBF\xBD\xEF\xBF\xBD");
}

// ============================================================================
// String Helper Tests
// ============================================================================

TEST(StringTest, DecodeEncode) {
    std::string text = "Caf\xC3\xA9 \xE4\xB8\xAD";
    auto cps = decode_utf8(text);
    ASSERT_EQ(cps.size(), 6u);
    EXPECT_EQ(cps[3], 0xE9u);
    EXPECT_EQ(cps[5], 0x4E2Du);
    EXPECT_EQ(encode_utf8(cps), text);
    EXPECT_EQ(code_point_count(text), 6u);
}

TEST(StringTest, SplitWhitespace) {
    auto words = split_whitespace("  big   news\ttoday \n");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], "big");
    EXPECT_EQ(words[1], "news");
    EXPECT_EQ(words[2], "today");

    EXPECT_TRUE(split_whitespace("").empty());
    EXPECT_TRUE(split_whitespace(" \t ").empty());
}

TEST(StringTest, SplitWhitespaceUnicodeSpaces) {
    auto words = split_whitespace("one\xC2\xA0two\xE3\x80\x80three");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[1], "two");
}

TEST(StringTest, SplitLines) {
    auto lines = split_lines("first\nsecond\r\nthird");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[1], "second");
    EXPECT_EQ(lines[2], "third");
}

TEST(StringTest, SplitLinesKeepsEmpties) {
    auto lines = split_lines("a\n\nb\n");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[1], "");
    EXPECT_EQ(lines[3], "");

    auto single = split_lines("");
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0], "");
}

TEST(StringTest, Join) {
    EXPECT_EQ(join({"a", "b", "c"}, " "), "a b c");
    EXPECT_EQ(join({"solo"}, "\n"), "solo");
    EXPECT_EQ(join({}, ","), "");
}

TEST(StringTest, ToUpper) {
    EXPECT_EQ(to_upper("breaking news"), "BREAKING NEWS");
    EXPECT_EQ(to_upper("caf\xC3\xA9"), "CAF\xC3\x89");
    EXPECT_EQ(to_upper("\xE4\xB8\xAD"), "\xE4\xB8\xAD");
}

TEST(StringTest, ToAsciiLower) {
    EXPECT_EQ(to_ascii_lower("Bottom_Center"), "bottom_center");
    EXPECT_EQ(to_ascii_lower("\xC3\x89"), "\xC3\x89");
}

TEST(StringTest, Trim) {
    EXPECT_EQ(trim("  hello \n"), "hello");
    EXPECT_EQ(trim("\t\r\n"), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(StringTest, EqualsIgnoreCase) {
    EXPECT_TRUE(equals_ignore_case("PNG", "png"));
    EXPECT_TRUE(equals_ignore_case("White_Shadow", "WHITE_SHADOW"));
    EXPECT_FALSE(equals_ignore_case("png", "pn"));
    EXPECT_FALSE(equals_ignore_case("jpeg", "jpg "));
}
