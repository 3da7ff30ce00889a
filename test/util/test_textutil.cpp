#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "util/TextUtil.hpp"

using namespace vcstrim;

// Test: Lines split on LF and CRLF, no phantom line after the final newline
TEST(TextUtilTest, SplitLines) {
    auto lines = TextUtil::splitLines("a\r\nb\n\nc\n");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "c");

    EXPECT_TRUE(TextUtil::splitLines("").empty());
    EXPECT_EQ(TextUtil::splitLines("no newline").size(), 1u);
}

// Test: Code point counting treats graph glyphs as one character
TEST(TextUtilTest, CharCountIsUtf8Aware) {
    EXPECT_EQ(TextUtil::charCount("abc"), 3u);
    EXPECT_EQ(TextUtil::charCount("\xE2\x94\x82 x"), 3u);  // "│ x"
    EXPECT_EQ(TextUtil::codePointAt("\xE2\x97\x86 rest", 0), "\xE2\x97\x86");
    EXPECT_EQ(TextUtil::codePointAt("ab", 5), "");
}

// Test: Truncation keeps the result within the limit, ellipsis included
TEST(TextUtilTest, TruncateChars) {
    EXPECT_EQ(TextUtil::truncateChars("short", 10), "short");
    EXPECT_EQ(TextUtil::truncateChars("exactly10!", 10), "exactly10!");
    std::string cut = TextUtil::truncateChars("abcdefghijkl", 10);
    EXPECT_EQ(cut, "abcdefghi\xE2\x80\xA6");
    EXPECT_EQ(TextUtil::charCount(cut), 10u);

    // The cut does not leave a space before the ellipsis
    EXPECT_EQ(TextUtil::truncateChars("squash commits into", 8), "squash\xE2\x80\xA6");

    // Zero disables the cap
    EXPECT_EQ(TextUtil::truncateChars("anything at all", 0), "anything at all");
}

// Test: Identifier alphabets
TEST(TextUtilTest, IdentifierTokens) {
    EXPECT_TRUE(TextUtil::isHexToken("7fd1a60b", 6));
    EXPECT_FALSE(TextUtil::isHexToken("7fd1a", 6));
    EXPECT_FALSE(TextUtil::isHexToken("7FD1A60B", 6));
    EXPECT_FALSE(TextUtil::isHexToken("kntqzsqt", 6));

    EXPECT_TRUE(TextUtil::isChangeIdToken("kntqzsqt", 8));
    EXPECT_FALSE(TextUtil::isChangeIdToken("kntq", 8));
    EXPECT_FALSE(TextUtil::isChangeIdToken("abcdefgh", 8));

    EXPECT_TRUE(TextUtil::isAlnumToken("abc123"));
    EXPECT_FALSE(TextUtil::isAlnumToken("main*"));
    EXPECT_FALSE(TextUtil::isAlnumToken(""));
}

// Test: Email detection tolerates angle brackets and trailing punctuation
TEST(TextUtilTest, EmailLike) {
    EXPECT_TRUE(TextUtil::isEmailLike("jane@example.com"));
    EXPECT_TRUE(TextUtil::isEmailLike("<jane@example.com>"));
    EXPECT_TRUE(TextUtil::isEmailLike("jane@example.com,"));
    EXPECT_FALSE(TextUtil::isEmailLike("@origin"));
    EXPECT_FALSE(TextUtil::isEmailLike("user@host"));
    EXPECT_FALSE(TextUtil::isEmailLike("main"));
}

// Test: Timestamp pieces
TEST(TextUtilTest, TimestampTokens) {
    EXPECT_TRUE(TextUtil::isDateToken("2024-02-28"));
    EXPECT_FALSE(TextUtil::isDateToken("2024-2-28"));
    EXPECT_TRUE(TextUtil::isTimeToken("14:56"));
    EXPECT_TRUE(TextUtil::isTimeToken("14:56:59"));
    EXPECT_TRUE(TextUtil::isTimeToken("14:56:59.123"));
    EXPECT_FALSE(TextUtil::isTimeToken("14h56"));
    EXPECT_TRUE(TextUtil::isZoneToken("+01:00"));
    EXPECT_TRUE(TextUtil::isZoneToken("-08:00"));
    EXPECT_FALSE(TextUtil::isZoneToken("01:00"));
}

// Test: Redaction removes email words and nothing else
TEST(TextUtilTest, RedactEmails) {
    EXPECT_EQ(TextUtil::redactEmails("Fix by jane@example.com today"), "Fix by today");
    EXPECT_EQ(TextUtil::redactEmails("ping <bob@corp.io>"), "ping");
    EXPECT_EQ(TextUtil::redactEmails("no address here"), "no address here");
    EXPECT_EQ(TextUtil::redactEmails("  @origin:  kept as is"), "  @origin:  kept as is");
}

// Test: Counts reject signs, blanks and trailing garbage
TEST(TextUtilTest, ParseCount) {
    size_t n = 0;
    EXPECT_TRUE(TextUtil::parseCount("42", n));
    EXPECT_EQ(n, 42u);
    EXPECT_FALSE(TextUtil::parseCount("-1", n));
    EXPECT_FALSE(TextUtil::parseCount("4x", n));
    EXPECT_FALSE(TextUtil::parseCount("", n));
}
