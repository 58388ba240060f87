#include "pageflow/pagination.h"
#include "pageflow/log.h"
#include <algorithm>
#include <cmath>

namespace pageflow {

const char* navigationResultName(NavigationResult result) {
    switch (result) {
        case NavigationResult::Started:              return "started";
        case NavigationResult::Tracking:             return "tracking";
        case NavigationResult::SnappedBack:          return "snapped-back";
        case NavigationResult::OutOfRangePage:       return "out-of-range";
        case NavigationResult::TransitionInProgress: return "transition-in-progress";
        case NavigationResult::NoChange:             return "no-change";
    }
    return "unknown";
}

Paginator::Paginator(PaginationSettings settings)
    : settings_(settings) {}

void Paginator::reset(int pageCount, int index) {
    pageCount_ = std::max(pageCount, 0);
    currentIndex_ = pageCount_ > 0 ? std::max(0, std::min(index, pageCount_ - 1)) : 0;
    fromIndex_ = currentIndex_;
    state_ = PaginationState::Idle;
    dragOffset_ = 0;
    elapsedMs_ = 0;
    PF_LOGD("paginator: reset pages=%d index=%d", pageCount_, currentIndex_);
}

// ---------------------------------------------------------------------------
// Gestures
// ---------------------------------------------------------------------------

NavigationResult Paginator::beginDrag() {
    if (isTransitioning()) return NavigationResult::TransitionInProgress;
    if (pageCount_ == 0) return NavigationResult::NoChange;
    state_ = PaginationState::Dragging;
    dragOffset_ = 0;
    return NavigationResult::Tracking;
}

NavigationResult Paginator::updateDrag(float delta) {
    if (isTransitioning()) return NavigationResult::TransitionInProgress;
    if (state_ != PaginationState::Dragging) return NavigationResult::NoChange;
    dragOffset_ += delta;
    return NavigationResult::Tracking;
}

NavigationResult Paginator::endDrag() {
    if (isTransitioning()) return NavigationResult::TransitionInProgress;
    if (state_ != PaginationState::Dragging) return NavigationResult::NoChange;

    float offset = dragOffset_;
    state_ = PaginationState::Idle;
    dragOffset_ = 0;

    if (std::fabs(offset) > settings_.swipeThreshold) {
        return offset < 0 ? next() : previous();
    }
    return snapBack();
}

// ---------------------------------------------------------------------------
// Direct navigation
// ---------------------------------------------------------------------------

NavigationResult Paginator::next() {
    if (isTransitioning()) return NavigationResult::TransitionInProgress;
    if (currentIndex_ >= pageCount_ - 1) return snapBack();
    return startTransition(currentIndex_ + 1);
}

NavigationResult Paginator::previous() {
    if (isTransitioning()) return NavigationResult::TransitionInProgress;
    if (currentIndex_ <= 0) return snapBack();
    return startTransition(currentIndex_ - 1);
}

NavigationResult Paginator::goToPage(int index) {
    if (index < 0 || index >= pageCount_) {
        PF_LOGD("paginator: jump to %d rejected, pages=%d", index, pageCount_);
        return NavigationResult::OutOfRangePage;
    }
    if (isTransitioning()) return NavigationResult::TransitionInProgress;
    if (index == currentIndex_) return NavigationResult::NoChange;
    return startTransition(index);
}

// ---------------------------------------------------------------------------
// Time
// ---------------------------------------------------------------------------

bool Paginator::advance(float elapsedMs) {
    if (!isTransitioning()) return false;
    elapsedMs_ += std::max(elapsedMs, 0.0f);
    if (elapsedMs_ >= settings_.transitionDurationMs) {
        finishTransition();
        return true;
    }
    return false;
}

void Paginator::finishTransition() {
    if (!isTransitioning()) return;
    state_ = PaginationState::Idle;
    fromIndex_ = currentIndex_;
    elapsedMs_ = 0;
}

float Paginator::transitionProgress() const {
    if (!isTransitioning()) return 0;
    if (settings_.transitionDurationMs <= 0) return 1;
    return std::min(elapsedMs_ / settings_.transitionDurationMs, 1.0f);
}

// ---------------------------------------------------------------------------
// Internal
// ---------------------------------------------------------------------------

NavigationResult Paginator::startTransition(int target) {
    fromIndex_ = currentIndex_;
    currentIndex_ = target;
    state_ = PaginationState::Transitioning;
    dragOffset_ = 0;
    elapsedMs_ = 0;
    PF_LOGD("paginator: transition %d -> %d", fromIndex_, currentIndex_);
    return NavigationResult::Started;
}

NavigationResult Paginator::snapBack() {
    state_ = PaginationState::Idle;
    dragOffset_ = 0;
    return NavigationResult::SnappedBack;
}

} // namespace pageflow
