#include "pageflow/session.h"
#include "pageflow/log.h"
#include <cmath>

namespace pageflow {

namespace {

int64_t roundedSeconds(double ms) {
    return static_cast<int64_t>(std::floor(ms / 1000.0 + 0.5));
}

size_t densitySlot(Density density) {
    return static_cast<size_t>(density);
}

} // anonymous namespace

ReadingSession::ReadingSession(std::string sessionId, int64_t startMs, Density density)
    : sessionId_(std::move(sessionId))
    , startMs_(startMs)
    , density_(density)
    , densityStartMs_(startMs) {}

void ReadingSession::startPage(int pageIndex, Density density, int64_t nowMs) {
    closeVisit(nowMs);

    if (density != density_) {
        closeDensity(nowMs);
        density_ = density;
        densityStartMs_ = nowMs;
    }

    PageVisit visit;
    visit.pageIndex = pageIndex;
    visit.density = density;
    visit.startMs = nowMs;
    visits_.push_back(visit);
}

SessionSummary ReadingSession::endSession(int64_t nowMs, int totalPages) {
    closeVisit(nowMs);
    closeDensity(nowMs);
    densityStartMs_ = nowMs;

    SessionSummary summary;
    summary.sessionId = sessionId_;
    summary.sessionStartMs = startMs_;
    summary.sessionEndMs = nowMs;
    summary.totalPagesRead = static_cast<int>(pagesRead_.size());
    summary.lastPageIndex = visits_.empty() ? 0 : visits_.back().pageIndex;
    summary.totalPages = totalPages;
    summary.lastDensity = density_;

    int64_t totalMs = 0;
    int counted = 0;
    for (const auto& visit : visits_) {
        if (visit.durationMs <= 0) continue;
        totalMs += visit.durationMs;
        ++counted;
    }
    summary.averageTimePerPageSec = counted > 0 ? roundedSeconds(static_cast<double>(totalMs) / counted) : 0;
    summary.totalTimeSpentReadingSec = roundedSeconds(static_cast<double>(totalMs));

    if (totalPages > 1) {
        double percent = static_cast<double>(summary.lastPageIndex) / (totalPages - 1) * 100.0;
        summary.progressPercentage = std::floor(percent * 100.0 + 0.5) / 100.0;
    } else {
        summary.progressPercentage = totalPages == 1 ? 100.0 : 0.0;
    }

    summary.timeInLessSec = roundedSeconds(static_cast<double>(densityTotalMs_[densitySlot(Density::Less)]));
    summary.timeInMediumSec = roundedSeconds(static_cast<double>(densityTotalMs_[densitySlot(Density::Medium)]));
    summary.timeInMoreSec = roundedSeconds(static_cast<double>(densityTotalMs_[densitySlot(Density::More)]));

    PF_LOGI("session '%s': read=%d last=%d/%d progress=%.2f%%",
            sessionId_.c_str(), summary.totalPagesRead, summary.lastPageIndex,
            totalPages, summary.progressPercentage);
    return summary;
}

void ReadingSession::closeVisit(int64_t nowMs) {
    if (visits_.empty() || !visits_.back().open) return;
    PageVisit& visit = visits_.back();
    visit.durationMs = nowMs - visit.startMs;
    visit.open = false;
    if (visit.durationMs >= kReadThresholdMs) {
        pagesRead_.insert(visit.pageIndex);
    }
}

void ReadingSession::closeDensity(int64_t nowMs) {
    if (nowMs > densityStartMs_) {
        densityTotalMs_[densitySlot(density_)] += nowMs - densityStartMs_;
    }
    densityStartMs_ = nowMs;
}

} // namespace pageflow
