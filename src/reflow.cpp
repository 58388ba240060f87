#include "pageflow/reflow.h"
#include "pageflow/chunker.h"
#include "pageflow/text.h"
#include "pageflow/log.h"
#include <algorithm>
#include <cmath>

namespace pageflow {

namespace {

int roundToIndex(double fraction, size_t count) {
    if (count == 0) return 0;
    int index = static_cast<int>(std::floor(fraction * static_cast<double>(count - 1) + 0.5));
    return std::max(0, std::min(index, static_cast<int>(count) - 1));
}

/// Whitespace-insensitive: block joins and split points differ between sizes
int findSnippet(const std::vector<Page>& pages, const std::string& snippet) {
    std::string needle = removeWhitespace(snippet);
    for (size_t i = 0; i < pages.size(); ++i) {
        if (removeWhitespace(pages[i].plainText()).find(needle) != std::string::npos) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

/// Indices of the pages belonging to one source chapter
std::vector<int> chapterPages(const std::vector<Page>& pages, int sourceChapterIndex) {
    std::vector<int> indices;
    for (size_t i = 0; i < pages.size(); ++i) {
        if (pages[i].sourceChapterIndex == sourceChapterIndex) {
            indices.push_back(static_cast<int>(i));
        }
    }
    return indices;
}

} // anonymous namespace

const char* matchStrategyName(MatchStrategy strategy) {
    switch (strategy) {
        case MatchStrategy::ExactText:       return "exact-text";
        case MatchStrategy::ChapterRelative: return "chapter-relative";
        case MatchStrategy::BookRelative:    return "book-relative";
        case MatchStrategy::EmptyResult:     return "empty";
    }
    return "unknown";
}

std::string extractTextSnippet(const std::string& text, const ReflowSettings& settings) {
    std::string source = trim(collapseWhitespace(text));
    if (source.empty()) return "";

    size_t maxLength = static_cast<size_t>(std::max(settings.snippetMaxLength, 1));
    size_t minLength = static_cast<size_t>(std::max(settings.snippetMinLength, 0));

    // Whole sentences first
    std::string accumulated;
    size_t accumulatedLen = 0;
    for (const auto& sentence : splitSentences(source)) {
        size_t len = utf8Length(sentence);
        if (accumulatedLen + len > maxLength) break;
        accumulated += sentence;
        accumulatedLen += len;
    }
    std::string snippet = trim(accumulated);
    if (!snippet.empty() && utf8Length(snippet) >= minLength) {
        return snippet;
    }

    if (utf8Length(source) <= maxLength) {
        return source;
    }

    // Prefix cut at a word boundary when one lies late enough
    std::string truncated = utf8Prefix(source, maxLength);
    size_t lastSpace = truncated.rfind(' ');
    if (lastSpace != std::string::npos &&
        static_cast<double>(utf8Length(truncated.substr(0, lastSpace))) > maxLength * 0.7) {
        return trim(truncated.substr(0, lastSpace));
    }
    return trim(truncated);
}

std::string pageSnippet(const Page& page, const ReflowSettings& settings) {
    size_t minLength = static_cast<size_t>(std::max(settings.snippetMinLength, 0));
    auto blocks = flattenBlocks(page.text);
    if (!blocks.empty()) {
        std::string snippet = extractTextSnippet(blocks.front().plainText(), settings);
        if (utf8Length(snippet) >= minLength) return snippet;
    }
    return extractTextSnippet(page.plainText(), settings);
}

RemapResult remap(const std::vector<Chapter>& chapters,
                  const std::vector<Page>& oldPages,
                  int oldIndex,
                  int newMaxChunkSize,
                  const ReflowSettings& settings) {
    RemapResult result;
    ChunkResult rebuilt = Chunker(newMaxChunkSize).build(chapters);
    result.pages = std::move(rebuilt.pages);
    result.chapterIndex = std::move(rebuilt.chapterIndex);

    if (result.pages.empty()) {
        PF_LOGW("remap: re-chunk at %d produced no pages", newMaxChunkSize);
        result.newIndex = 0;
        result.strategy = MatchStrategy::EmptyResult;
        return result;
    }
    if (oldPages.empty()) {
        result.newIndex = 0;
        result.strategy = MatchStrategy::BookRelative;
        return result;
    }

    int current = std::max(0, std::min(oldIndex, static_cast<int>(oldPages.size()) - 1));
    const Page& currentPage = oldPages[current];
    size_t minLength = static_cast<size_t>(std::max(settings.snippetMinLength, 0));

    // 1. Exact text anchor
    std::string snippet;
    try {
        snippet = pageSnippet(currentPage, settings);
    } catch (const std::exception& e) {
        PF_LOGW("remap: no snippet for page %d: %s", currentPage.id, e.what());
    }
    if (!snippet.empty() && utf8Length(snippet) >= minLength) {
        int found = findSnippet(result.pages, snippet);
        if (found >= 0) {
            result.newIndex = found;
            result.strategy = MatchStrategy::ExactText;
            PF_LOGI("remap: old=%d/%zu new=%d/%zu strategy=%s",
                    current, oldPages.size(), result.newIndex, result.pages.size(),
                    matchStrategyName(result.strategy));
            return result;
        }
    }

    // 2. Relative position inside the same chapter
    auto oldChapter = chapterPages(oldPages, currentPage.sourceChapterIndex);
    auto newChapter = chapterPages(result.pages, currentPage.sourceChapterIndex);
    if (!oldChapter.empty() && !newChapter.empty()) {
        auto it = std::find(oldChapter.begin(), oldChapter.end(), current);
        int position = static_cast<int>(it - oldChapter.begin());
        double fraction = static_cast<double>(position) /
                          std::max(static_cast<int>(oldChapter.size()) - 1, 1);
        result.newIndex = newChapter[roundToIndex(fraction, newChapter.size())];
        result.strategy = MatchStrategy::ChapterRelative;
    } else {
        // 3. Relative position in the whole book
        double fraction = oldPages.size() > 1
            ? static_cast<double>(current) / static_cast<double>(oldPages.size() - 1)
            : 0.0;
        result.newIndex = roundToIndex(fraction, result.pages.size());
        result.strategy = MatchStrategy::BookRelative;
    }

    PF_LOGI("remap: old=%d/%zu new=%d/%zu strategy=%s",
            current, oldPages.size(), result.newIndex, result.pages.size(),
            matchStrategyName(result.strategy));
    return result;
}

} // namespace pageflow
