#pragma once

#include "pageflow/chapter.h"
#include "pageflow/page.h"
#include "pageflow/settings.h"
#include <string>
#include <vector>

namespace pageflow {

/// Which tier of the position-matching cascade produced the new index
enum class MatchStrategy {
    ExactText,          // New page contains the old page's text snippet
    ChapterRelative,    // Same fractional position inside the same chapter
    BookRelative,       // Same fractional position in the whole book
    EmptyResult,        // Re-chunk produced no pages, index is 0
};

const char* matchStrategyName(MatchStrategy strategy);

/// Output of a re-chunk with the reader's relocated position
struct RemapResult {
    std::vector<Page> pages;
    ChapterIndex chapterIndex;
    int newIndex = 0;
    MatchStrategy strategy = MatchStrategy::EmptyResult;
};

/// Representative snippet anchored at the start of `text`: whole sentences
/// up to snippetMaxLength code points, or a word-aligned prefix when the
/// sentences are too short or too long. Returns "" for empty text.
std::string extractTextSnippet(const std::string& text, const ReflowSettings& settings = {});

/// Snippet for a page: from its first block when that alone is long enough
/// to search for, otherwise from the whole page text
std::string pageSnippet(const Page& page, const ReflowSettings& settings = {});

/// Re-chunk `chapters` at newMaxChunkSize and map oldIndex in oldPages to
/// the best matching index in the new pages. Never fails on content: an
/// out-of-range oldIndex is clamped and an empty result maps to index 0.
/// Throws PageflowError(InvalidChunkSize) for a non-positive size.
RemapResult remap(const std::vector<Chapter>& chapters,
                  const std::vector<Page>& oldPages,
                  int oldIndex,
                  int newMaxChunkSize,
                  const ReflowSettings& settings = {});

} // namespace pageflow
