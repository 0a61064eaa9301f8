#ifndef PAGE_TURN_CONTROLLER_H
#define PAGE_TURN_CONTROLLER_H

#include "config_manager.h"
#include "deadline_timer.h"
#include "discrete_gesture_handler.h"
#include "feedback_emitter.h"
#include "gesture_types.h"
#include "navigation_manager.h"
#include "scroll_accumulator.h"

#include <functional>
#include <utility>

/**
 * @brief Turns raw pointer, touch and key input into "go to page N" intents
 *
 * One instance per open document view. All calls happen on the event-loop
 * thread; tick() must be called once per loop iteration to drive the timers.
 */
class PageTurnController
{
public:
    using PageTurnCallback = std::function<void(const PageTurnIntent&)>;

    explicit PageTurnController(const PageFlipConfig& config = PageFlipConfig());
    ~PageTurnController();

    PageTurnController(const PageTurnController&) = delete;
    PageTurnController& operator=(const PageTurnController&) = delete;

    void setConfig(const PageFlipConfig& config);
    const PageFlipConfig& getConfig() const
    {
        return m_config;
    }

    void setPageTurnCallback(PageTurnCallback callback)
    {
        m_onPageTurn = std::move(callback);
    }

    // Reader position
    void setReaderPosition(int currentPage, int totalPages);
    void setPageCount(int totalPages);

    /**
     * @brief Start over for a newly opened document: page 1, fresh gesture, no pending timers
     */
    void resetForDocument(int totalPages);

    /**
     * @brief Drop all pending timers and detach the callback
     */
    void shutdown();

    /**
     * @brief Feed one wheel event
     *
     * Only input that pushes past the edge the view is resting on accumulates
     * towards a turn; everything else belongs to the page's own scrolling.
     * @return false if the event was left for the content to scroll
     */
    bool handleWheel(double deltaY, WheelDeltaMode mode, TimestampMs now);

    // Scroll position of the current page
    void setScrollEdges(bool atTop, bool atBottom);
    void handleContentScroll(bool atTop, bool atBottom, TimestampMs now);
    bool isAtTopEdge() const
    {
        return m_atTop;
    }
    bool isAtBottomEdge() const
    {
        return m_atBottom;
    }
    bool isContentScrolling(TimestampMs now) const
    {
        return m_scrollSettleTimer.isArmed() && now < m_scrollSettleTimer.deadline();
    }

    // Discrete input
    bool handleTap(float x, float containerWidth);
    void handleTouchStart(float x, TimestampMs now);
    void handleTouchMove(float x);
    bool handleTouchEnd(float x, TimestampMs now);
    void handleTouchCancel();
    bool handleKey(NavigationKey key, TimestampMs now);
    bool handlePageJumpDigit(char digit, TimestampMs now);

    void setClickNavigationEnabled(bool enabled);
    bool isClickNavigationEnabled() const
    {
        return m_gestures.isTapNavigationEnabled();
    }

    /**
     * @brief Poll every timer owned by the controller
     */
    void tick(TimestampMs now);

    // State queries for the rendering layer
    const FeedbackState& feedback() const
    {
        return m_feedback.state();
    }
    FeedbackBand feedbackBand() const
    {
        return m_feedback.band();
    }
    const GestureState& gestureState() const
    {
        return m_accumulator.state();
    }
    AccumulatorPhase accumulatorPhase(TimestampMs now) const
    {
        return m_accumulator.phase(now);
    }
    bool isCoolingDown(TimestampMs now) const
    {
        return m_accumulator.isCoolingDown(now);
    }
    Uint32 cooldownRemainingMs(TimestampMs now) const
    {
        return m_accumulator.cooldownRemainingMs(now);
    }
    const NavigationManager& navigation() const
    {
        return m_navigation;
    }
    bool hasPendingTimers() const
    {
        return m_accumulator.hasPendingTimers() || m_feedback.hasPendingTimer() || m_scrollSettleTimer.isArmed();
    }
    int turnCount() const
    {
        return m_turnCount;
    }

private:
    bool emitStep(ScrollDirection direction, TurnSource source);
    bool emitTarget(int targetPage, ScrollDirection direction, TurnSource source);
    bool wheelReachesEdge(double deltaY, TimestampMs now) const;

    PageFlipConfig m_config;
    ScrollAccumulator m_accumulator;
    FeedbackEmitter m_feedback;
    DiscreteGestureHandler m_gestures;
    NavigationManager m_navigation;

    // Pages that fit the view rest on both edges
    bool m_atTop = true;
    bool m_atBottom = true;
    DeadlineTimer m_scrollSettleTimer;

    PageTurnCallback m_onPageTurn;
    int m_turnCount = 0;
};

#endif // PAGE_TURN_CONTROLLER_H
