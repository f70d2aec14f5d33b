#include <gtest/gtest.h>
#include "core/TextUtils.h"

TEST(TextUtilsTest, TrimStripsSpacesTabsAndLineEnds) {
    EXPECT_EQ(TextUtils::trim("  Title: x \r\n"), "Title: x");
    EXPECT_EQ(TextUtils::trim("\t\t"), "");
    EXPECT_EQ(TextUtils::trim(""), "");
}

TEST(TextUtilsTest, ParseIntOrFallsBackOnGarbage) {
    EXPECT_EQ(TextUtils::parseIntOr("12345", -1), 12345);
    EXPECT_EQ(TextUtils::parseIntOr(" 42 ", -1), 42);
    EXPECT_EQ(TextUtils::parseIntOr("-7", 0), -7);
    EXPECT_EQ(TextUtils::parseIntOr("", -1), -1);
    EXPECT_EQ(TextUtils::parseIntOr("abc", -1), -1);
    EXPECT_EQ(TextUtils::parseIntOr("12abc", -1), -1);
    EXPECT_EQ(TextUtils::parseIntOr("99999999999999999999999", 3), 3);
}

TEST(TextUtilsTest, FoldCaseHandlesNonAscii) {
    EXPECT_EQ(TextUtils::foldCase("LoVe"), "love");
    EXPECT_EQ(TextUtils::foldCase("\xC3\x84RGER"), "\xC3\xA4rger");  // ÄRGER
}

TEST(TextUtilsTest, NormalizeKeyCollapsesWhitespace) {
    EXPECT_EQ(TextUtils::normalizeKey("  Some   Song\tTitle "), "some song title");
    EXPECT_EQ(TextUtils::normalizeKey("ARTIST"), TextUtils::normalizeKey("artist"));
}

TEST(TextUtilsTest, ContainsFoldedIsCaseInsensitive) {
    EXPECT_TRUE(TextUtils::containsFolded("Endless LOVE Song", "love"));
    EXPECT_TRUE(TextUtils::containsFolded("anything", ""));
    EXPECT_FALSE(TextUtils::containsFolded("Glove", "loves"));
}

TEST(TextUtilsTest, DecodeTextStripsUtf8Bom) {
    std::string out;
    ASSERT_TRUE(TextUtils::decodeText("\xEF\xBB\xBFosu file format v14", out));
    EXPECT_EQ(out, "osu file format v14");
}

TEST(TextUtilsTest, DecodeTextTranscodesUtf16) {
    std::string le("\xFF\xFE" "A\0b\0", 6);
    std::string be("\xFE\xFF" "\0A\0b", 6);
    std::string out;
    ASSERT_TRUE(TextUtils::decodeText(le, out));
    EXPECT_EQ(out, "Ab");
    ASSERT_TRUE(TextUtils::decodeText(be, out));
    EXPECT_EQ(out, "Ab");
}

TEST(TextUtilsTest, DecodeTextRejectsBinary) {
    std::string out;
    EXPECT_FALSE(TextUtils::decodeText(std::string("\x89PNG\r\n\x1a\n\0\0", 10), out));
    EXPECT_FALSE(TextUtils::decodeText("\xC3\x28", out));
    EXPECT_FALSE(TextUtils::decodeText(std::string("\xFF\xFE" "A", 3), out));
}
