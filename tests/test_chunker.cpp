#include <gtest/gtest.h>
#include "pageflow/chunker.h"
#include "pageflow/classifier.h"
#include "pageflow/errors.h"
#include "pageflow/text.h"
#include <algorithm>
#include <cctype>
#include <map>

using namespace pageflow;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Prose of exactly `length` ASCII characters, with a sentence break every few words
static std::string prose(size_t length, const std::string& seed) {
    std::string text;
    int i = 0;
    while (text.size() < length) {
        if (!text.empty()) text += (i % 7 == 0) ? ". " : " ";
        text += seed + std::to_string(i++);
    }
    text.resize(length);
    if (text.back() == ' ') text.back() = 'x';
    return text;
}

static Chapter makeChapter(const std::string& content,
                           std::optional<std::string> title = std::nullopt,
                           int sourceIndex = 0,
                           std::optional<int> explicitNumber = std::nullopt,
                           bool metadata = false) {
    Chapter chapter;
    chapter.title = std::move(title);
    chapter.normalizedContent = content;
    chapter.sourceIndex = sourceIndex;
    chapter.explicitChapterNumber = explicitNumber;
    chapter.isMetadata = metadata;
    return chapter;
}

static std::string withoutSpaces(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (!isSpace(c)) out += c;
    }
    return out;
}

/// A chapter set exercising every split path: several normal paragraphs,
/// a long multi-sentence paragraph, a run-on sentence and one huge word
static std::vector<Chapter> mixedBook() {
    std::string runOn;
    for (int i = 0; i < 150; ++i) runOn += "runon" + std::to_string(i) + " ";

    std::vector<Chapter> chapters;
    chapters.push_back(makeChapter("<h1>Contents</h1><p>" + prose(80, "toc") + "</p>",
                                   std::nullopt, 0, std::nullopt, true));
    chapters.push_back(makeChapter("<h2>Opening</h2><p>" + prose(120, "alpha") + "</p><p class=\"x\">" +
                                   prose(900, "beta") + "</p><p>" + prose(60, "gamma") + "</p>",
                                   std::string("Opening"), 1));
    chapters.push_back(makeChapter("<div><p>" + prose(200, "delta") + "</p><p>" + runOn +
                                   "</p></div><p>" + std::string(450, 'w') + "</p><p>" +
                                   prose(40, "end") + "</p>",
                                   std::string("Middle"), 2));
    chapters.push_back(makeChapter("<p>" + prose(310, "omega") + "<br>" + prose(90, "psi") + "</p>",
                                   std::nullopt, 3, 9));
    return chapters;
}

// MARK: - Block flattening

TEST(ChunkerTest, FlattenWrapsLooseInlineContent) {
    auto blocks = flattenBlocks("<p>a</p>loose <em>text</em><h2>H</h2><div><p>x</p></div>");
    ASSERT_EQ(blocks.size(), 4);
    EXPECT_EQ(blocks[0].tag, "p");
    EXPECT_EQ(serialize(blocks[1]), "<p>loose <em>text</em></p>");
    EXPECT_EQ(blocks[2].tag, "h2");
    EXPECT_EQ(blocks[3].tag, "div");
}

TEST(ChunkerTest, FlattenDescendsIntoInlineWrappers) {
    auto blocks = flattenBlocks("<a href=\"x\"><p>in link</p></a>");
    ASSERT_EQ(blocks.size(), 1);
    EXPECT_EQ(serialize(blocks[0]), "<p>in link</p>");
}

TEST(ChunkerTest, FlattenSynthesizesParagraphForBareText) {
    auto blocks = flattenBlocks("just <strong>text</strong>");
    ASSERT_EQ(blocks.size(), 1);
    EXPECT_EQ(serialize(blocks[0]), "<p>just <strong>text</strong></p>");
}

// MARK: - Oversized block split

TEST(ChunkerTest, SplitBySentencesThenWords) {
    auto blocks = flattenBlocks("<p class=\"x\">One two. Three four five. Six.</p>");
    ASSERT_EQ(blocks.size(), 1);
    auto fragments = splitOversizedBlock(blocks[0], 12);
    ASSERT_EQ(fragments.size(), 4);
    EXPECT_EQ(serialize(fragments[0]), "<p class=\"x\">One two.</p>");
    EXPECT_EQ(fragments[1].plainText(), "Three four");
    EXPECT_EQ(fragments[2].plainText(), "five.");
    EXPECT_EQ(fragments[3].plainText(), "Six.");
}

TEST(ChunkerTest, FittingBlockUnchanged) {
    auto blocks = flattenBlocks("<h3>Short <em>title</em></h3>");
    auto fragments = splitOversizedBlock(blocks[0], 100);
    ASSERT_EQ(fragments.size(), 1);
    EXPECT_EQ(serialize(fragments[0]), "<h3>Short <em>title</em></h3>");
}

TEST(ChunkerTest, SingleLongWordEmittedWhole) {
    auto blocks = flattenBlocks("<p>" + std::string(40, 'z') + "</p>");
    auto fragments = splitOversizedBlock(blocks[0], 10);
    ASSERT_EQ(fragments.size(), 1);
    EXPECT_EQ(utf8Length(fragments[0].plainText()), 40);
}

// MARK: - Packing scenarios

TEST(ChunkerTest, FlushOnlyWhenBufferNonEmpty) {
    std::string content = "<p>" + prose(100, "a") + "</p><p>" + prose(450, "b") +
                          "</p><p>" + prose(50, "c") + "</p>";
    auto result = chunk({makeChapter(content, std::string("intro"))}, 500);

    ASSERT_EQ(result.pages.size(), 2);
    EXPECT_EQ(utf8Length(result.pages[0].plainText()), 100);
    EXPECT_EQ(utf8Length(result.pages[1].plainText()), 500);
    EXPECT_EQ(result.pages[0].id, 1);
    EXPECT_EQ(result.pages[1].id, 2);
    EXPECT_EQ(result.pages[0].title, "intro");
    EXPECT_FALSE(result.pages[1].title.has_value());
    EXPECT_EQ(result.pages[1].chapterDisplayTitle, "intro");
}

TEST(ChunkerTest, ChapterNumberFromIdentifierPattern) {
    SourceChapter source;
    source.root = parseMarkup("<p>" + prose(300, "story") + "</p>");
    source.label = "The Hunt";
    source.identifier = "chapter-7";
    source.path = "OEBPS/c7.xhtml";

    auto chapters = ChapterClassifier().classifyAll({source});
    ASSERT_EQ(chapters.size(), 1);
    auto result = chunk(chapters, 500);

    ASSERT_FALSE(result.pages.empty());
    for (const auto& page : result.pages) {
        EXPECT_EQ(page.chapterNumber, 7);
    }
    EXPECT_GE(result.chapterIndex.totalChapters, 7);
    ASSERT_EQ(result.chapterIndex.entries.size(), 1);
    EXPECT_EQ(result.chapterIndex.entries[0].chapterNumber, 7);
}

TEST(ChunkerTest, SequentialNumberingSkipsMetadata) {
    std::vector<Chapter> chapters;
    chapters.push_back(makeChapter("<p>Contents</p>", std::nullopt, 0, std::nullopt, true));
    chapters.push_back(makeChapter("<p>One.</p>", std::string("First"), 1));
    chapters.push_back(makeChapter("", std::string("Empty"), 2));
    chapters.push_back(makeChapter("<p>Two.</p>", std::string("Second"), 3));

    auto result = chunk(chapters, 500);
    ASSERT_EQ(result.pages.size(), 3);
    EXPECT_FALSE(result.pages[0].chapterNumber.has_value());
    EXPECT_EQ(result.pages[1].chapterNumber, 1);
    EXPECT_EQ(result.pages[2].chapterNumber, 2);
    EXPECT_EQ(result.pages[2].sourceChapterIndex, 3);

    ASSERT_EQ(result.chapterIndex.entries.size(), 2);
    EXPECT_EQ(result.chapterIndex.entries[0].startPageIndex, 1);
    EXPECT_EQ(result.chapterIndex.entries[1].displayTitle, "Second");
    EXPECT_EQ(result.chapterIndex.totalChapters, 2);
}

TEST(ChunkerTest, TotalChaptersIsHighestNumberNotCount) {
    std::vector<Chapter> chapters;
    chapters.push_back(makeChapter("<p>Three.</p>", std::nullopt, 0, 3));
    chapters.push_back(makeChapter("<p>Five.</p>", std::nullopt, 1, 5));
    chapters.push_back(makeChapter("<p>Seven.</p>", std::nullopt, 2, 7));

    auto result = chunk(chapters, 500);
    EXPECT_EQ(result.chapterIndex.entries.size(), 3);
    EXPECT_EQ(result.chapterIndex.totalChapters, 7);
}

TEST(ChunkerTest, EntryForPage) {
    auto result = chunk(mixedBook(), 300);
    for (const auto& entry : result.chapterIndex.entries) {
        EXPECT_EQ(result.chapterIndex.entryForPage(entry.startPageIndex), &entry);
        EXPECT_EQ(result.chapterIndex.entryForPage(entry.endPageIndex), &entry);
    }
    // Metadata pages have no entry
    EXPECT_EQ(result.chapterIndex.entryForPage(0), nullptr);
    EXPECT_EQ(result.chapterIndex.entryForPage(-1), nullptr);
}

// MARK: - Properties

TEST(ChunkerTest, SizeBoundHoldsExceptForSingleWords) {
    for (int maxSize : {300, 400, 500, 800}) {
        auto result = chunk(mixedBook(), maxSize);
        for (const auto& page : result.pages) {
            std::string text = page.plainText();
            size_t len = utf8Length(text);
            if (len > static_cast<size_t>(maxSize)) {
                EXPECT_EQ(splitWords(text).size(), 1) << "page " << page.id << " at " << maxSize;
            }
        }
    }
}

TEST(ChunkerTest, LosslessPerChapter) {
    auto chapters = mixedBook();
    for (int maxSize : {300, 500, 800}) {
        auto result = chunk(chapters, maxSize);
        std::map<int, std::string> joined;
        for (const auto& page : result.pages) {
            joined[page.sourceChapterIndex] += page.plainText();
        }
        for (const auto& chapter : chapters) {
            EXPECT_EQ(withoutSpaces(joined[chapter.sourceIndex]),
                      withoutSpaces(stripTags(chapter.normalizedContent)))
                << "chapter " << chapter.sourceIndex << " at " << maxSize;
        }
    }
}

TEST(ChunkerTest, IdempotentRechunk) {
    auto chapters = mixedBook();
    auto first = chunk(chapters, 400);
    auto second = chunk(chapters, 400);
    ASSERT_EQ(first.pages.size(), second.pages.size());
    for (size_t i = 0; i < first.pages.size(); ++i) {
        EXPECT_EQ(first.pages[i].id, second.pages[i].id);
        EXPECT_EQ(first.pages[i].text, second.pages[i].text);
        EXPECT_EQ(first.pages[i].title, second.pages[i].title);
        EXPECT_EQ(first.pages[i].sourceChapterIndex, second.pages[i].sourceChapterIndex);
        EXPECT_EQ(first.pages[i].chapterNumber, second.pages[i].chapterNumber);
    }
}

TEST(ChunkerTest, ChapterIndexRangesIncreasing) {
    auto result = chunk(mixedBook(), 300);
    const auto& entries = result.chapterIndex.entries;
    ASSERT_EQ(entries.size(), 3);
    int previousEnd = -1;
    for (const auto& entry : entries) {
        EXPECT_LE(entry.startPageIndex, entry.endPageIndex);
        EXPECT_GT(entry.startPageIndex, previousEnd);
        previousEnd = entry.endPageIndex;
    }
    EXPECT_EQ(previousEnd, static_cast<int>(result.pages.size()) - 1);
    EXPECT_EQ(result.chapterIndex.totalChapters, 9);
}

TEST(ChunkerTest, TitleOnlyOnFirstPageOfChapter) {
    auto result = chunk(mixedBook(), 300);
    std::map<int, int> seen;
    for (const auto& page : result.pages) {
        int count = seen[page.sourceChapterIndex]++;
        if (count > 0) {
            EXPECT_FALSE(page.title.has_value()) << "page " << page.id;
        }
    }
    const auto* opening = result.chapterIndex.entryForPage(1);
    ASSERT_NE(opening, nullptr);
    EXPECT_EQ(result.pages[opening->startPageIndex].title, "Opening");
}

TEST(ChunkerTest, SplitFragmentsKeepBlockAttributes) {
    auto result = chunk({makeChapter("<p class=\"x\">" + prose(900, "beta") + "</p>")}, 300);
    ASSERT_GT(result.pages.size(), 2);
    for (const auto& page : result.pages) {
        EXPECT_EQ(page.text.rfind("<p class=\"x\">", 0), 0);
    }
}

// MARK: - Errors

TEST(ChunkerTest, NoContentThrows) {
    try {
        chunk({makeChapter(""), makeChapter("<p> </p>")}, 500);
        FAIL() << "expected NoExtractableContent";
    } catch (const PageflowError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NoExtractableContent);
    }
    EXPECT_THROW(chunk({}, 500), PageflowError);
}

TEST(ChunkerTest, NonPositiveSizeThrows) {
    try {
        chunk(mixedBook(), 0);
        FAIL() << "expected InvalidChunkSize";
    } catch (const PageflowError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidChunkSize);
    }
}

TEST(ChunkerTest, BuildReturnsEmptyWithoutThrowing) {
    Chunker chunker(500);
    auto result = chunker.build({makeChapter("")});
    EXPECT_TRUE(result.pages.empty());
    EXPECT_EQ(result.chapterIndex.totalChapters, 0);
}
