#pragma once

#include "pageflow/chapter.h"
#include "pageflow/page.h"
#include "pageflow/pagination.h"
#include "pageflow/progress.h"
#include "pageflow/reflow.h"
#include "pageflow/settings.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pageflow {

/// "Chapter 3 of 12" for the current page
struct ChapterIndicator {
    int chapterNumber = 0;
    int totalChapters = 0;
};

/// Main entry point for a reading session.
/// Owns the classified chapters, the current page list and ChapterIndex,
/// and the pagination state; persists the position through a ProgressStore.
class Reader {
public:
    explicit Reader(ReaderSettings settings = {},
                    std::shared_ptr<ProgressStore> store = nullptr);
    ~Reader();

    /// Chunk already-classified chapters and restore the saved position.
    /// Throws PageflowError(NoExtractableContent) if no page results; the
    /// previously open book is kept in that case.
    void open(std::vector<Chapter> chapters, const std::string& bookIdentifier);

    /// Classify a content source's chapters, then open them
    void open(const ContentSource& source, const std::string& bookIdentifier);

    bool isOpen() const { return !pages_.empty(); }

    /// Re-chunk at the density's size, keeping the reading position.
    /// Returns the matching strategy used (EmptyResult if no book is open).
    MatchStrategy changeDensity(Density density);

    /// Same, from a "less" / "medium" / "more" key.
    /// Throws PageflowError(InvalidDensity) without any state change.
    MatchStrategy changeDensity(const std::string& densityKey);

    /// Chapter number and total for the current page, if known
    std::optional<ChapterIndicator> chapterIndicator() const;

    // -- Navigation (delegates to Paginator) ---------------------------------

    NavigationResult beginDrag();
    NavigationResult updateDrag(float delta);
    NavigationResult endDrag();
    NavigationResult next();
    NavigationResult previous();

    /// Jump to a 1-based page number
    NavigationResult goToPage(int pageNumber);

    bool advance(float elapsedMs);
    void finishTransition();

    // -- State ---------------------------------------------------------------

    const std::vector<Page>& pages() const { return pages_; }
    const ChapterIndex& chapterIndex() const { return chapterIndex_; }
    const std::vector<Chapter>& chapters() const { return chapters_; }
    const Paginator& paginator() const { return paginator_; }
    const std::string& bookIdentifier() const { return bookIdentifier_; }
    Density density() const { return settings_.density; }
    int chunkSize() const { return chunkSize_; }

    int currentIndex() const { return paginator_.currentIndex(); }

    /// Current page, or nullptr when no book is open
    const Page* currentPage() const;

private:
    ReaderSettings settings_;
    std::shared_ptr<ProgressStore> store_;
    std::vector<Chapter> chapters_;
    std::vector<Page> pages_;
    ChapterIndex chapterIndex_;
    Paginator paginator_;
    std::string bookIdentifier_;
    int chunkSize_ = 0;

    NavigationResult persistIfMoved(NavigationResult result);
    void savePosition();
};

} // namespace pageflow
