#include <gtest/gtest.h>
#include "pageflow/classifier.h"
#include "pageflow/normalizer.h"

using namespace pageflow;

namespace {

SourceChapter makeSource(const std::string& html,
                         const std::string& label,
                         const std::string& identifier,
                         const std::string& path = "OEBPS/text.xhtml") {
    SourceChapter source;
    source.root = parseMarkup(html);
    source.label = label;
    source.identifier = identifier;
    source.path = path;
    return source;
}

std::string manyLinks(int count) {
    std::string html = "<p>";
    for (int i = 0; i < count; ++i) {
        html += "<a href=\"ch" + std::to_string(i) + ".xhtml\">Part " + std::to_string(i) + "</a> ";
    }
    return html + "</p>";
}

} // namespace

// MARK: - Identifier and label patterns

TEST(ClassifierTest, ChapterNumberFromIdentifier) {
    EXPECT_EQ(chapterNumberFromIdentifier("chapter-7"), 7);
    EXPECT_EQ(chapterNumberFromIdentifier("Chapter_12"), 12);
    EXPECT_EQ(chapterNumberFromIdentifier("id_chapter3_body"), 3);
    EXPECT_EQ(chapterNumberFromIdentifier("chapterx-chapter-4"), 4);
    EXPECT_FALSE(chapterNumberFromIdentifier("prologue").has_value());
    EXPECT_FALSE(chapterNumberFromIdentifier("chapter").has_value());
    EXPECT_FALSE(chapterNumberFromIdentifier("chapter--2").has_value());
}

TEST(ClassifierTest, DisplayTitleSuppressesBareChapterLabels) {
    EXPECT_FALSE(displayTitleFromLabel("Chapter 12").has_value());
    EXPECT_FALSE(displayTitleFromLabel("CH 3").has_value());
    EXPECT_FALSE(displayTitleFromLabel("ch3").has_value());
    EXPECT_FALSE(displayTitleFromLabel("   ").has_value());
    EXPECT_EQ(displayTitleFromLabel("Chapter 12: The Storm"), "Chapter 12: The Storm");
    EXPECT_EQ(displayTitleFromLabel("  The Return  "), "The Return");
    EXPECT_EQ(displayTitleFromLabel("Chapters"), "Chapters");
    EXPECT_EQ(displayTitleFromLabel("Charlotte"), "Charlotte");
}

TEST(ClassifierTest, CountLinks) {
    EXPECT_EQ(countLinks("<p><a href=\"1\">a</a> <em><a href=\"2\">b</a></em></p>"), 2);
    EXPECT_EQ(countLinks("<p>none</p>"), 0);
}

// MARK: - Metadata detection

TEST(ClassifierTest, MetadataByPhrase) {
    ChapterClassifier classifier;
    EXPECT_TRUE(classifier.isMetadata("<h1>Table of Contents</h1>", "a.xhtml", "toc-page"));
    EXPECT_TRUE(classifier.isMetadata("<p>Copyright 1851 by the author.</p>", "a.xhtml", "front"));
    EXPECT_TRUE(classifier.isMetadata("<p>This eBook is for the use of anyone.</p>", "a.xhtml", "x"));
    EXPECT_FALSE(classifier.isMetadata("<p>Call me Ishmael.</p>", "a.xhtml", "chapter-1"));
}

TEST(ClassifierTest, MetadataPhraseMatchesInsideWords) {
    ChapterClassifier classifier;
    EXPECT_TRUE(classifier.isMetadata("<p>Free ebooks by volunteers.</p>", "a.xhtml", "x"));
    EXPECT_TRUE(classifier.isMetadata("<p>All texts copyrighted elsewhere.</p>", "a.xhtml", "x"));
    EXPECT_TRUE(classifier.isMetadata("<p>Licensed to the reader.</p>", "a.xhtml", "x"));
    EXPECT_TRUE(classifier.isMetadata("<p>Tableofcontents follows.</p>", "a.xhtml", "x"));
    EXPECT_TRUE(classifier.isMetadata("<p>The stock fell.</p>", "a.xhtml", "x"));
    EXPECT_FALSE(classifier.isMetadata("<p>The market fell.</p>", "a.xhtml", "x"));
}

TEST(ClassifierTest, MetadataByPathOrIdentifier) {
    ChapterClassifier classifier;
    EXPECT_TRUE(classifier.isMetadata("<p>Story text.</p>", "OEBPS/Cover.xhtml", "item1"));
    EXPECT_TRUE(classifier.isMetadata("<p>Story text.</p>", "OEBPS/titlepage.xhtml", "item1"));
    EXPECT_TRUE(classifier.isMetadata("<p>Story text.</p>", "OEBPS/ch1.xhtml", "pg-header"));
    EXPECT_FALSE(classifier.isMetadata("<p>Story text.</p>", "OEBPS/ch1.xhtml", "chapter-1"));
}

TEST(ClassifierTest, MetadataByLinkCount) {
    ChapterClassifier classifier;
    EXPECT_FALSE(classifier.isMetadata(manyLinks(10), "nav1.xhtml", "item"));
    EXPECT_TRUE(classifier.isMetadata(manyLinks(11), "nav1.xhtml", "item"));
}

TEST(ClassifierTest, CustomSettings) {
    ClassifierSettings settings;
    settings.metadataPhrases = {"dedication"};
    settings.navigationLinkThreshold = 2;
    ChapterClassifier classifier(settings);
    EXPECT_TRUE(classifier.isMetadata("<p>Dedication</p>", "a.xhtml", "x"));
    EXPECT_FALSE(classifier.isMetadata("<p>Contents</p>", "a.xhtml", "x"));
    EXPECT_TRUE(classifier.isMetadata(manyLinks(3), "a.xhtml", "x"));
}

// MARK: - Classification

TEST(ClassifierTest, ClassifyContentChapter) {
    ChapterClassifier classifier;
    auto source = makeSource("<p>It was a dark night.</p>", "The Storm", "chapter-7");
    Chapter chapter = classifier.classify("<p>It was a dark night.</p>", source, 4);
    EXPECT_FALSE(chapter.isMetadata);
    EXPECT_EQ(chapter.title, "The Storm");
    EXPECT_EQ(chapter.explicitChapterNumber, 7);
    EXPECT_EQ(chapter.sourceIndex, 4);
}

TEST(ClassifierTest, ClassifyMetadataChapterHasNoTitleOrNumber) {
    ChapterClassifier classifier;
    auto source = makeSource("<p>Contents</p>", "Contents", "chapter-1");
    Chapter chapter = classifier.classify("<p>Contents</p>", source, 0);
    EXPECT_TRUE(chapter.isMetadata);
    EXPECT_FALSE(chapter.title.has_value());
    EXPECT_FALSE(chapter.explicitChapterNumber.has_value());
}

TEST(ClassifierTest, ClassifyAllSkipsEmptyAndBrokenChapters) {
    std::vector<SourceChapter> sources;
    sources.push_back(makeSource("<html><body><h1>Contents</h1></body></html>", "Contents", "toc"));
    sources.push_back(makeSource("<html><body><img src=\"a.png\"/></body></html>", "Image", "img"));
    sources.push_back(makeSource("<html><body><p>Once upon a time.</p></body></html>", "Chapter 1", "chapter-1"));

    // A tree deeper than the walkers accept
    SourceChapter broken;
    MarkupNode node = MarkupNode::textNode("deep");
    for (int i = 0; i < kMaxMarkupDepth + 5; ++i) {
        MarkupNode wrapper = MarkupNode::element("em");
        wrapper.children.push_back(std::move(node));
        node = std::move(wrapper);
    }
    broken.root.children.push_back(std::move(node));
    broken.identifier = "broken";
    sources.push_back(std::move(broken));

    sources.push_back(makeSource("<p>The end.</p>", "Epilogue", "epilogue"));

    ChapterClassifier classifier;
    auto chapters = classifier.classifyAll(sources);
    ASSERT_EQ(chapters.size(), 3);

    EXPECT_TRUE(chapters[0].isMetadata);
    EXPECT_EQ(chapters[0].sourceIndex, 0);

    EXPECT_FALSE(chapters[1].isMetadata);
    EXPECT_EQ(chapters[1].sourceIndex, 2);
    EXPECT_FALSE(chapters[1].title.has_value());
    EXPECT_EQ(chapters[1].explicitChapterNumber, 1);
    EXPECT_EQ(chapters[1].normalizedContent, "<p>Once upon a time.</p>");

    EXPECT_EQ(chapters[2].sourceIndex, 4);
    EXPECT_EQ(chapters[2].title, "Epilogue");
    EXPECT_FALSE(chapters[2].explicitChapterNumber.has_value());
}

// MARK: - Numbering

TEST(ClassifierTest, NumbererMixesExplicitAndSequential) {
    auto make = [](std::optional<int> explicitNumber, bool metadata) {
        Chapter chapter;
        chapter.explicitChapterNumber = explicitNumber;
        chapter.isMetadata = metadata;
        return chapter;
    };

    ChapterNumberer numberer;
    EXPECT_FALSE(numberer.assign(make(std::nullopt, true)).has_value());
    EXPECT_EQ(numberer.assign(make(3, false)), 3);
    EXPECT_EQ(numberer.assign(make(std::nullopt, false)), 4);
    EXPECT_FALSE(numberer.assign(make(std::nullopt, true)).has_value());
    EXPECT_EQ(numberer.assign(make(std::nullopt, false)), 5);
    EXPECT_EQ(numberer.assign(make(2, false)), 2);
    EXPECT_EQ(numberer.assign(make(std::nullopt, false)), 6);
}
