#include "pageflow/chunker.h"
#include "pageflow/classifier.h"
#include "pageflow/errors.h"
#include "pageflow/text.h"
#include "pageflow/log.h"
#include <algorithm>

namespace pageflow {

namespace {

/// Tags that form a page block of their own
bool isChunkBlockTag(const std::string& tag) {
    return tag == "p" || tag == "div" || isHeadingTag(tag);
}

bool containsChunkBlock(const MarkupNode& node) {
    for (const auto& child : node.children) {
        if (!child.isElement()) continue;
        if (isChunkBlockTag(child.tag) || containsChunkBlock(child)) return true;
    }
    return false;
}

/// Collects top-level blocks, gathering loose inline runs into synthetic paragraphs
class BlockCollector {
public:
    void collect(const MarkupNode& node) {
        for (const auto& child : node.children) {
            if (child.isElement() && isChunkBlockTag(child.tag)) {
                flushLoose();
                blocks_.push_back(child);
            } else if (child.isElement() && containsChunkBlock(child)) {
                collect(child);
            } else {
                loose_.children.push_back(child);
            }
        }
    }

    std::vector<MarkupNode> finish() {
        flushLoose();
        return std::move(blocks_);
    }

private:
    std::vector<MarkupNode> blocks_;
    MarkupNode loose_ = MarkupNode::element("p");

    void flushLoose() {
        if (loose_.children.empty()) return;
        if (!trim(loose_.plainText()).empty()) {
            blocks_.push_back(std::move(loose_));
        }
        loose_ = MarkupNode::element("p");
    }
};

MarkupNode makeFragment(const MarkupNode& block, const std::string& text) {
    MarkupNode fragment = MarkupNode::element(block.tag);
    fragment.attributes = block.attributes;
    fragment.children.push_back(MarkupNode::textNode(text));
    return fragment;
}

} // anonymous namespace

std::vector<MarkupNode> flattenBlocks(const std::string& normalizedContent) {
    BlockCollector collector;
    collector.collect(parseMarkup(normalizedContent));
    return collector.finish();
}

std::vector<MarkupNode> splitOversizedBlock(const MarkupNode& block, int maxChunkSize) {
    size_t limit = static_cast<size_t>(maxChunkSize);
    if (utf8Length(block.plainText()) <= limit) {
        return {block};
    }

    std::string text = trim(collapseWhitespace(block.plainText()));

    std::vector<std::string> parts;
    for (const auto& part : packPieces(splitSentences(text), limit)) {
        if (utf8Length(part) <= limit) {
            parts.push_back(part);
            continue;
        }
        // Run-on sentence: fall back to word packing
        auto wordParts = packPieces(splitWords(part), limit);
        parts.insert(parts.end(), wordParts.begin(), wordParts.end());
    }

    PF_LOGD("splitOversizedBlock: <%s> len=%zu max=%d fragments=%zu",
            block.tag.c_str(), utf8Length(text), maxChunkSize, parts.size());

    std::vector<MarkupNode> fragments;
    fragments.reserve(parts.size());
    for (const auto& part : parts) {
        fragments.push_back(makeFragment(block, part));
    }
    return fragments;
}

// ---------------------------------------------------------------------------
// Chunker
// ---------------------------------------------------------------------------

Chunker::Chunker(int maxChunkSize)
    : maxChunkSize_(maxChunkSize) {
    if (maxChunkSize_ <= 0) {
        throw PageflowError(ErrorCode::InvalidChunkSize,
                            "maxChunkSize must be positive, got " + std::to_string(maxChunkSize));
    }
}

std::vector<std::string> Chunker::chunkChapter(const Chapter& chapter) const {
    std::vector<std::string> pageTexts;
    std::string buffer;
    size_t bufferLen = 0;
    size_t limit = static_cast<size_t>(maxChunkSize_);

    for (const auto& block : flattenBlocks(chapter.normalizedContent)) {
        for (const auto& fragment : splitOversizedBlock(block, maxChunkSize_)) {
            size_t len = utf8Length(fragment.plainText());
            if (bufferLen > 0 && bufferLen + len > limit) {
                pageTexts.push_back(std::move(buffer));
                buffer.clear();
                bufferLen = 0;
            }
            buffer += serialize(fragment);
            bufferLen += len;
        }
    }

    if (bufferLen > 0) {
        pageTexts.push_back(std::move(buffer));
    }
    return pageTexts;
}

ChunkResult Chunker::build(const std::vector<Chapter>& chapters) const {
    ChunkResult result;
    ChapterNumberer numberer;
    int maxNumber = 0;
    bool anyNumber = false;

    for (const auto& chapter : chapters) {
        std::vector<std::string> pageTexts;
        try {
            if (trim(stripTags(chapter.normalizedContent)).empty()) {
                PF_LOGD("chunk: chapter %d has no text", chapter.sourceIndex);
                continue;
            }
            pageTexts = chunkChapter(chapter);
        } catch (const std::exception& e) {
            PF_LOGW("chunk: skipping chapter %d: %s", chapter.sourceIndex, e.what());
            continue;
        }
        if (pageTexts.empty()) continue;

        std::optional<int> number = numberer.assign(chapter);
        int startIndex = static_cast<int>(result.pages.size());

        for (size_t i = 0; i < pageTexts.size(); ++i) {
            Page page;
            page.id = static_cast<int>(result.pages.size()) + 1;
            if (i == 0) page.title = chapter.title;
            page.sourceChapterIndex = chapter.sourceIndex;
            page.chapterNumber = number;
            page.chapterDisplayTitle = chapter.title;
            page.text = std::move(pageTexts[i]);
            result.pages.push_back(std::move(page));
        }

        if (chapter.isMetadata) continue;

        ChapterIndexEntry entry;
        entry.displayTitle = chapter.title;
        entry.startPageIndex = startIndex;
        entry.endPageIndex = static_cast<int>(result.pages.size()) - 1;
        entry.chapterNumber = number;
        result.chapterIndex.entries.push_back(std::move(entry));

        if (number) {
            anyNumber = true;
            maxNumber = std::max(maxNumber, *number);
        }
    }

    result.chapterIndex.totalChapters = anyNumber
        ? maxNumber
        : static_cast<int>(result.chapterIndex.entries.size());

    PF_LOGI("chunk: chapters=%zu pages=%zu entries=%zu totalChapters=%d max=%d",
            chapters.size(), result.pages.size(), result.chapterIndex.entries.size(),
            result.chapterIndex.totalChapters, maxChunkSize_);
    return result;
}

ChunkResult chunk(const std::vector<Chapter>& chapters, int maxChunkSize) {
    ChunkResult result = Chunker(maxChunkSize).build(chapters);
    if (result.pages.empty()) {
        throw PageflowError(ErrorCode::NoExtractableContent,
                            "no chapter produced any page text");
    }
    return result;
}

} // namespace pageflow
