#include <gtest/gtest.h>
#include "pageflow/text.h"

using namespace pageflow;

// MARK: - UTF-8

TEST(TextTest, Utf8LengthCountsCodePoints) {
    EXPECT_EQ(utf8Length(""), 0);
    EXPECT_EQ(utf8Length("abc"), 3);
    EXPECT_EQ(utf8Length("caf\xc3\xa9"), 4);              // café
    EXPECT_EQ(utf8Length("\xe4\xb8\xad\xe6\x96\x87"), 2);  // 中文
}

TEST(TextTest, Utf8PrefixNeverSplitsSequences) {
    EXPECT_EQ(utf8Prefix("caf\xc3\xa9 noir", 4), "caf\xc3\xa9");
    EXPECT_EQ(utf8Prefix("abc", 10), "abc");
    EXPECT_EQ(utf8Prefix("abc", 0), "");
}

TEST(TextTest, AppendUtf8RoundTrip) {
    std::string out;
    appendUtf8(out, 0x2014);
    EXPECT_EQ(out, "\xe2\x80\x94");
    EXPECT_EQ(utf8CharLen(out.c_str()), 3);
    EXPECT_EQ(utf8Decode(out.c_str(), 3), 0x2014u);
}

// MARK: - Whitespace and case

TEST(TextTest, TrimAndCollapse) {
    EXPECT_EQ(trim("  \n hello \t"), "hello");
    EXPECT_EQ(trim(" \n "), "");
    EXPECT_EQ(collapseWhitespace("  a \n\n b\tc "), " a b c ");
}

TEST(TextTest, RemoveWhitespace) {
    EXPECT_EQ(removeWhitespace(" one\ttwo \n three "), "onetwothree");
    EXPECT_EQ(removeWhitespace("   "), "");
}

// MARK: - Segmentation

TEST(TextTest, SplitSentencesKeepsTerminatorsAndSpace) {
    auto sentences = splitSentences("One. Two! Three? Four");
    ASSERT_EQ(sentences.size(), 4);
    EXPECT_EQ(sentences[0], "One. ");
    EXPECT_EQ(sentences[1], "Two! ");
    EXPECT_EQ(sentences[2], "Three? ");
    EXPECT_EQ(sentences[3], "Four");
}

TEST(TextTest, SplitSentencesClosingQuotes) {
    auto sentences = splitSentences("\"Stop!\" he said. (Really.) Then\xe2\x80\x9d");
    ASSERT_EQ(sentences.size(), 4);
    EXPECT_EQ(sentences[0], "\"Stop!\" ");
    EXPECT_EQ(sentences[1], "he said. ");
    EXPECT_EQ(sentences[2], "(Really.) ");
    EXPECT_EQ(sentences[3], "Then\xe2\x80\x9d");
}

TEST(TextTest, SplitSentencesEllipsisStaysTogether) {
    auto sentences = splitSentences("Wait... what?! Fine.");
    ASSERT_EQ(sentences.size(), 3);
    EXPECT_EQ(sentences[0], "Wait... ");
    EXPECT_EQ(sentences[1], "what?! ");
}

TEST(TextTest, SplitSentencesEmpty) {
    EXPECT_TRUE(splitSentences("").empty());
    EXPECT_TRUE(splitSentences("   ").empty());
}

TEST(TextTest, SplitWords) {
    auto words = splitWords("  alpha beta\n\tgamma ");
    ASSERT_EQ(words.size(), 3);
    EXPECT_EQ(words[0], "alpha");
    EXPECT_EQ(words[2], "gamma");
}

TEST(TextTest, PackPiecesGreedy) {
    auto parts = packPieces({"aaaa ", "bbbb ", "cccc"}, 9);
    ASSERT_EQ(parts.size(), 2);
    EXPECT_EQ(parts[0], "aaaa bbbb");
    EXPECT_EQ(parts[1], "cccc");
}

TEST(TextTest, PackPiecesOversizedPieceStandsAlone) {
    auto parts = packPieces({"ab", "abcdefghij", "cd"}, 5);
    ASSERT_EQ(parts.size(), 3);
    EXPECT_EQ(parts[1], "abcdefghij");
}

TEST(TextTest, PackPiecesSkipsEmpty) {
    auto parts = packPieces({"", "  ", "x"}, 5);
    ASSERT_EQ(parts.size(), 1);
    EXPECT_EQ(parts[0], "x");
}
