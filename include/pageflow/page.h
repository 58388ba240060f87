#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pageflow {

/// A single size-bounded page of chapter text.
/// The presentation layer renders `text` as-is; it only uses the page
/// markup subset (p, br, h1-h6, em, strong, span, a, div).
struct Page {
    int id = 0;                                      // 1-based, sequential within one chunking run
    std::optional<std::string> title;                // Only on the first page of a chapter
    int sourceChapterIndex = 0;                      // Chapter::sourceIndex of the owning chapter
    std::optional<int> chapterNumber;                // Absent for metadata chapters
    std::optional<std::string> chapterDisplayTitle;  // Chapter title, repeated on every page
    std::string text;                                // Page markup

    /// De-tagged, entity-decoded text
    std::string plainText() const;
};

/// Page range of one content chapter
struct ChapterIndexEntry {
    std::optional<std::string> displayTitle;
    int startPageIndex = 0;    // 0-based, inclusive
    int endPageIndex = 0;      // 0-based, inclusive
    std::optional<int> chapterNumber;
};

/// Chapter navigation metadata derived from one chunking run
struct ChapterIndex {
    std::vector<ChapterIndexEntry> entries;
    int totalChapters = 0;     // Highest chapter number seen, not the entry count

    /// Entry whose page range contains pageIndex, or nullptr
    const ChapterIndexEntry* entryForPage(int pageIndex) const;
};

/// Output of the Chunker
struct ChunkResult {
    std::vector<Page> pages;
    ChapterIndex chapterIndex;
};

} // namespace pageflow
