#include <gtest/gtest.h>

#include <string>

#include "gnb/sanitize/text_sanitizer.hpp"

using namespace gnb::sanitize;

namespace {

const std::string kReplacement = "\xEF\xBF\xBD";  // U+FFFD

} // namespace

// ---------------------------------------------------------------------------
// Code point classification
// ---------------------------------------------------------------------------

TEST(CodePointSafetyTest, PrintableAsciiAndScripts) {
    EXPECT_TRUE(isCodePointSafeForDisplay(U'a'));
    EXPECT_TRUE(isCodePointSafeForDisplay(U'&'));
    EXPECT_TRUE(isCodePointSafeForDisplay(U' '));
    EXPECT_TRUE(isCodePointSafeForDisplay(U'é'));   // e acute
    EXPECT_TRUE(isCodePointSafeForDisplay(U'中'));   // CJK
    EXPECT_TRUE(isCodePointSafeForDisplay(U'\U0001F600'));  // emoji
}

TEST(CodePointSafetyTest, ControlCharacters) {
    EXPECT_FALSE(isCodePointSafeForDisplay(0x00));
    EXPECT_FALSE(isCodePointSafeForDisplay(0x15));
    EXPECT_FALSE(isCodePointSafeForDisplay(0x1B));
    EXPECT_FALSE(isCodePointSafeForDisplay(0x7F));
    EXPECT_FALSE(isCodePointSafeForDisplay(0x85));
    EXPECT_FALSE(isCodePointSafeForDisplay(0x9F));
}

TEST(CodePointSafetyTest, InvisibleAndBidiFormatting) {
    EXPECT_FALSE(isCodePointSafeForDisplay(0x00AD));  // soft hyphen
    EXPECT_FALSE(isCodePointSafeForDisplay(0x200B));  // zero width space
    EXPECT_FALSE(isCodePointSafeForDisplay(0x202E));  // right-to-left override
    EXPECT_FALSE(isCodePointSafeForDisplay(0x2066));  // left-to-right isolate
    EXPECT_FALSE(isCodePointSafeForDisplay(0x2028));  // line separator
    EXPECT_FALSE(isCodePointSafeForDisplay(0xFEFF));  // byte order mark
    EXPECT_FALSE(isCodePointSafeForDisplay(0xFE0F));  // variation selector
}

TEST(CodePointSafetyTest, DefaultIgnorableFillers) {
    EXPECT_FALSE(isCodePointSafeForDisplay(0x034F));  // combining grapheme joiner
    EXPECT_FALSE(isCodePointSafeForDisplay(0x115F));  // Hangul choseong filler
    EXPECT_FALSE(isCodePointSafeForDisplay(0x1160));  // Hangul jungseong filler
    EXPECT_FALSE(isCodePointSafeForDisplay(0x17B4));  // Khmer inherent vowel
    EXPECT_FALSE(isCodePointSafeForDisplay(0x17B5));
    EXPECT_FALSE(isCodePointSafeForDisplay(0x180B));  // Mongolian variation selector
    EXPECT_FALSE(isCodePointSafeForDisplay(0x3164));  // Hangul filler
    EXPECT_FALSE(isCodePointSafeForDisplay(0xFFA0));  // halfwidth Hangul filler

    // Neighbours stay visible.
    EXPECT_TRUE(isCodePointSafeForDisplay(0x0301));  // combining acute accent
    EXPECT_TRUE(isCodePointSafeForDisplay(0x1161));  // Hangul jungseong A
    EXPECT_TRUE(isCodePointSafeForDisplay(0x17B6));  // Khmer vowel sign AA
    EXPECT_TRUE(isCodePointSafeForDisplay(0x3165));  // Hangul letter ssangnieun
    EXPECT_TRUE(isCodePointSafeForDisplay(0xFFA1));  // halfwidth Hangul kiyeok
}

TEST(SanitizeTextTest, HangulFillerReplaced) {
    // U+3164 renders as blank space and can disguise an empty summary.
    EXPECT_EQ(sanitizeText("\xE3\x85\xA4" "ok"), kReplacement + "ok");
}

TEST(CodePointSafetyTest, SurrogatesNoncharactersPrivateUse) {
    EXPECT_FALSE(isCodePointSafeForDisplay(0xD800));
    EXPECT_FALSE(isCodePointSafeForDisplay(0xDFFF));
    EXPECT_FALSE(isCodePointSafeForDisplay(0xE000));
    EXPECT_FALSE(isCodePointSafeForDisplay(0xF8FF));
    EXPECT_FALSE(isCodePointSafeForDisplay(0xFDD0));
    EXPECT_FALSE(isCodePointSafeForDisplay(0xFFFE));
    EXPECT_FALSE(isCodePointSafeForDisplay(0x1FFFF));
    EXPECT_FALSE(isCodePointSafeForDisplay(0xE0001));  // language tag
    EXPECT_FALSE(isCodePointSafeForDisplay(0x10FFFD));
    EXPECT_FALSE(isCodePointSafeForDisplay(0x110000));
}

TEST(CodePointSafetyTest, ReplacementCharacterIsSafe) {
    EXPECT_TRUE(isCodePointSafeForDisplay(kReplacementCharacter));
}

// ---------------------------------------------------------------------------
// sanitizeText
// ---------------------------------------------------------------------------

TEST(SanitizeTextTest, SafeTextUnchanged) {
    EXPECT_EQ(sanitizeText("&"), "&");
    EXPECT_EQ(sanitizeText("\n"), "\n");
    EXPECT_EQ(sanitizeText("\t"), "\t");
    EXPECT_EQ(sanitizeText("Build \xE2\x9C\x94 done"), "Build \xE2\x9C\x94 done");
    EXPECT_EQ(sanitizeText(""), "");
}

TEST(SanitizeTextTest, ControlCharacterReplaced) {
    EXPECT_EQ(sanitizeText("a\x15\n"), "a" + kReplacement + "\n");
}

TEST(SanitizeTextTest, CarriageReturns) {
    EXPECT_EQ(sanitizeText("a\r\nb"), "a\nb");
    EXPECT_EQ(sanitizeText("a\rb"), "a\nb");
    EXPECT_EQ(sanitizeText("a\r\r\nb"), "a\n\nb");
    EXPECT_EQ(sanitizeText("a\r"), "a\n");
}

TEST(SanitizeTextTest, BidiOverrideReplaced) {
    EXPECT_EQ(sanitizeText("x\xE2\x80\xAEy"), "x" + kReplacement + "y");
}

TEST(SanitizeTextTest, MalformedUtf8Replaced) {
    EXPECT_EQ(sanitizeText("a\xFF" "b"), "a" + kReplacement + "b");
    // Truncated three-byte sequence is one maximal subpart.
    EXPECT_EQ(sanitizeText("a\xE2\x82" "b"), "a" + kReplacement + "b");
    // Overlong encoding of '/'.
    EXPECT_EQ(sanitizeText("\xC0\xAF"), kReplacement + kReplacement);
    // Encoded surrogate.
    EXPECT_EQ(sanitizeText("\xED\xA0\x80"), kReplacement + kReplacement + kReplacement);
}

TEST(SanitizeTextTest, LineLimit) {
    std::string text;
    for (std::size_t i = 0; i < kMaxLines; ++i) {
        text += "a\n";
    }
    EXPECT_EQ(sanitizeText(text), text);

    std::string longer = text + "a\n";
    EXPECT_EQ(sanitizeText(longer), text);
}

TEST(SanitizeTextTest, LongLinesWrapped) {
    std::string expected;
    for (std::size_t i = 0; i < kMaxLines; ++i) {
        expected += std::string(kMaxCharsPerLine, 'a');
        expected += '\n';
    }
    ASSERT_EQ(expected.size(), 1001u * 500u);

    EXPECT_EQ(sanitizeText(std::string(500000, 'a')), expected);
    EXPECT_EQ(sanitizeText(std::string(1000000, 'a')), expected);
}

TEST(SanitizeTextTest, WrapCountsCodePointsNotBytes) {
    // 1000 two-byte characters fill exactly one line.
    std::string line;
    for (std::size_t i = 0; i < kMaxCharsPerLine; ++i) {
        line += "\xC3\xA9";
    }
    EXPECT_EQ(sanitizeText(line), line + "\n");
    EXPECT_EQ(sanitizeText(line + "x"), line + "\nx");

    std::string shorter(kMaxCharsPerLine - 1, 'a');
    EXPECT_EQ(sanitizeText(shorter), shorter);
}
