#pragma once

#include "pageflow/settings.h"

namespace pageflow {

enum class PaginationState {
    Idle,
    Dragging,
    Transitioning,
};

/// Outcome of a navigation event. Rejections are values, never exceptions.
enum class NavigationResult {
    Started,               // A page transition is now in flight
    Tracking,              // Drag accepted, page unchanged
    SnappedBack,           // Drag below threshold or past the first/last page
    OutOfRangePage,        // Jump target outside the page list
    TransitionInProgress,  // Ignored: another transition is in flight
    NoChange,              // Nothing to do (same page, no drag, empty book)
};

const char* navigationResultName(NavigationResult result);

/// Page-flip state machine driven by discrete presentation events.
/// States: Idle(index), Dragging(index, offset), Transitioning(from, to).
/// Only one transition may be in flight; events arriving meanwhile are
/// dropped, not queued.
class Paginator {
public:
    explicit Paginator(PaginationSettings settings = {});

    /// Replace the page list size and move to `index` (clamped), cancelling
    /// any drag or transition. Used after every (re)chunk.
    void reset(int pageCount, int index = 0);

    // -- Gestures ------------------------------------------------------------

    NavigationResult beginDrag();

    /// Add `delta` to the drag offset (negative = toward the next page)
    NavigationResult updateDrag(float delta);

    /// Release: transition to the adjacent page if |offset| > swipeThreshold
    NavigationResult endDrag();

    // -- Direct navigation ---------------------------------------------------

    NavigationResult next();
    NavigationResult previous();

    /// Jump to a 0-based page index
    NavigationResult goToPage(int index);

    // -- Time ----------------------------------------------------------------

    /// Advance the transition clock; returns true when a transition completed
    bool advance(float elapsedMs);

    /// Complete the in-flight transition immediately
    void finishTransition();

    // -- State ---------------------------------------------------------------

    PaginationState state() const { return state_; }
    bool isTransitioning() const { return state_ == PaginationState::Transitioning; }

    /// Committed page: the transition target while transitioning
    int currentIndex() const { return currentIndex_; }
    int transitionFrom() const { return fromIndex_; }
    int pageCount() const { return pageCount_; }
    float dragOffset() const { return dragOffset_; }

    /// 0..1 progress of the in-flight transition (0 when idle)
    float transitionProgress() const;

private:
    PaginationSettings settings_;
    PaginationState state_ = PaginationState::Idle;
    int pageCount_ = 0;
    int currentIndex_ = 0;
    int fromIndex_ = 0;
    float dragOffset_ = 0;
    float elapsedMs_ = 0;

    NavigationResult startTransition(int target);
    NavigationResult snapBack();
};

} // namespace pageflow
