#pragma once

#include "pageflow/settings.h"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace pageflow {

/// Statistics of one finished reading session. Times are whole seconds.
struct SessionSummary {
    std::string sessionId;
    int64_t sessionStartMs = 0;
    int64_t sessionEndMs = 0;
    int totalPagesRead = 0;            // Distinct pages viewed for >= the read threshold
    int lastPageIndex = 0;
    int totalPages = 0;
    double progressPercentage = 0;     // 0..100, two decimals
    int64_t averageTimePerPageSec = 0;
    int64_t totalTimeSpentReadingSec = 0;
    Density lastDensity = Density::Medium;
    int64_t timeInLessSec = 0;
    int64_t timeInMediumSec = 0;
    int64_t timeInMoreSec = 0;
};

/// Page-view tracking for one reading session.
/// All timestamps are caller-supplied milliseconds on a monotonic clock.
class ReadingSession {
public:
    /// A page counts as read after this much viewing time
    static constexpr int64_t kReadThresholdMs = 2000;

    ReadingSession(std::string sessionId, int64_t startMs, Density density = Density::Medium);

    /// Close the current page view and start viewing pageIndex
    void startPage(int pageIndex, Density density, int64_t nowMs);

    /// Close the open page view and density interval and summarize.
    /// totalPages is the current page count of the book.
    SessionSummary endSession(int64_t nowMs, int totalPages);

    size_t pagesRead() const { return pagesRead_.size(); }
    Density density() const { return density_; }

private:
    struct PageVisit {
        int pageIndex = 0;
        Density density = Density::Medium;
        int64_t startMs = 0;
        int64_t durationMs = 0;
        bool open = true;
    };

    std::string sessionId_;
    int64_t startMs_;
    Density density_;
    int64_t densityStartMs_;
    int64_t densityTotalMs_[3] = {0, 0, 0};
    std::vector<PageVisit> visits_;
    std::set<int> pagesRead_;

    void closeVisit(int64_t nowMs);
    void closeDensity(int64_t nowMs);
};

} // namespace pageflow
