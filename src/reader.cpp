#include "pageflow/reader.h"
#include "pageflow/chunker.h"
#include "pageflow/classifier.h"
#include "pageflow/log.h"
#include <chrono>

namespace pageflow {

namespace {

int64_t nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

Reader::Reader(ReaderSettings settings, std::shared_ptr<ProgressStore> store)
    : settings_(std::move(settings))
    , store_(std::move(store))
    , paginator_(settings_.pagination) {}

Reader::~Reader() = default;

void Reader::open(std::vector<Chapter> chapters, const std::string& bookIdentifier) {
    PF_LOGI("open: book='%s' chapters=%zu", bookIdentifier.c_str(), chapters.size());

    std::optional<ReadingPosition> saved;
    if (store_) saved = store_->load();

    // The density preference is global, the page index belongs to one book
    Density density = saved ? saved->density : settings_.density;
    int size = settings_.bulkLoad ? kBulkLoadChunkSize : chunkSizeForDensity(density);

    ChunkResult result = chunk(chapters, size);

    int startIndex = 0;
    if (saved && saved->bookIdentifier == bookIdentifier) {
        if (saved->pageIndex < static_cast<int>(result.pages.size())) {
            startIndex = saved->pageIndex;
        } else {
            PF_LOGW("open: saved page %d out of range (%zu pages)",
                    saved->pageIndex, result.pages.size());
        }
    }

    chapters_ = std::move(chapters);
    pages_ = std::move(result.pages);
    chapterIndex_ = std::move(result.chapterIndex);
    bookIdentifier_ = bookIdentifier;
    settings_.density = density;
    chunkSize_ = size;
    paginator_.reset(static_cast<int>(pages_.size()), startIndex);

    PF_LOGI("open: book='%s' pages=%zu density=%s size=%d start=%d",
            bookIdentifier_.c_str(), pages_.size(), densityName(density), size, startIndex);
}

void Reader::open(const ContentSource& source, const std::string& bookIdentifier) {
    ChapterClassifier classifier(settings_.classifier);
    open(classifier.classifyAll(source.chapters()), bookIdentifier);
}

MatchStrategy Reader::changeDensity(Density density) {
    if (!isOpen()) {
        PF_LOGW("changeDensity: no book open");
        return MatchStrategy::EmptyResult;
    }

    int size = chunkSizeForDensity(density);
    RemapResult result = remap(chapters_, pages_, currentIndex(), size, settings_.reflow);
    if (result.pages.empty()) {
        PF_LOGW("changeDensity: re-chunk at %d produced no pages, keeping %d", size, chunkSize_);
        return MatchStrategy::EmptyResult;
    }

    // Wholesale replacement: pages, index and cursor swap together
    pages_ = std::move(result.pages);
    chapterIndex_ = std::move(result.chapterIndex);
    settings_.density = density;
    chunkSize_ = size;
    paginator_.reset(static_cast<int>(pages_.size()), result.newIndex);
    savePosition();

    PF_LOGI("changeDensity: density=%s pages=%zu index=%d",
            densityName(density), pages_.size(), result.newIndex);
    return result.strategy;
}

MatchStrategy Reader::changeDensity(const std::string& densityKey) {
    return changeDensity(parseDensity(densityKey));
}

std::optional<ChapterIndicator> Reader::chapterIndicator() const {
    const Page* page = currentPage();
    if (!page) return std::nullopt;

    std::optional<int> number = page->chapterNumber;
    if (!number || *number <= 0) {
        const ChapterIndexEntry* entry = chapterIndex_.entryForPage(currentIndex());
        if (entry) number = entry->chapterNumber;
    }
    if (!number || *number <= 0) return std::nullopt;

    ChapterIndicator indicator;
    indicator.chapterNumber = *number;
    indicator.totalChapters = chapterIndex_.totalChapters;
    return indicator;
}

const Page* Reader::currentPage() const {
    int index = currentIndex();
    if (index < 0 || index >= static_cast<int>(pages_.size())) return nullptr;
    return &pages_[index];
}

// ---------------------------------------------------------------------------
// Navigation delegates
// ---------------------------------------------------------------------------

NavigationResult Reader::beginDrag() {
    return paginator_.beginDrag();
}

NavigationResult Reader::updateDrag(float delta) {
    return paginator_.updateDrag(delta);
}

NavigationResult Reader::endDrag() {
    return persistIfMoved(paginator_.endDrag());
}

NavigationResult Reader::next() {
    return persistIfMoved(paginator_.next());
}

NavigationResult Reader::previous() {
    return persistIfMoved(paginator_.previous());
}

NavigationResult Reader::goToPage(int pageNumber) {
    return persistIfMoved(paginator_.goToPage(pageNumber - 1));
}

bool Reader::advance(float elapsedMs) {
    return paginator_.advance(elapsedMs);
}

void Reader::finishTransition() {
    paginator_.finishTransition();
}

// ---------------------------------------------------------------------------
// Internal
// ---------------------------------------------------------------------------

NavigationResult Reader::persistIfMoved(NavigationResult result) {
    if (result == NavigationResult::Started) {
        savePosition();
    }
    return result;
}

void Reader::savePosition() {
    if (!store_ || bookIdentifier_.empty()) return;
    ReadingPosition position;
    position.bookIdentifier = bookIdentifier_;
    position.pageIndex = currentIndex();
    position.density = settings_.density;
    position.timestampMs = nowMs();
    store_->save(position);
}

} // namespace pageflow
