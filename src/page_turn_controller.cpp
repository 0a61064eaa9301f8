#include "page_turn_controller.h"

#include <iostream>

PageTurnController::PageTurnController(const PageFlipConfig& config)
    : m_config(config),
      m_accumulator(config),
      m_feedback(config.feedbackNoiseFloor, config.feedbackFadeMs),
      m_gestures(config.swipeThresholdPx, config.swipeMaxDurationMs)
{
    m_gestures.setTapNavigationEnabled(config.clickNavigationEnabled);
}

PageTurnController::~PageTurnController()
{
    shutdown();
}

void PageTurnController::setConfig(const PageFlipConfig& config)
{
    m_config = config;
    m_accumulator.setConfig(config);
    m_feedback.configure(config.feedbackNoiseFloor, config.feedbackFadeMs);
    m_gestures.configure(config.swipeThresholdPx, config.swipeMaxDurationMs);
    m_gestures.setTapNavigationEnabled(config.clickNavigationEnabled);
}

void PageTurnController::setReaderPosition(int currentPage, int totalPages)
{
    m_navigation.setPageCount(totalPages);
    m_navigation.setCurrentPage(currentPage);
}

void PageTurnController::setPageCount(int totalPages)
{
    int before = m_navigation.getCurrentPage();
    m_navigation.setPageCount(totalPages);
    if (m_navigation.getCurrentPage() != before)
    {
        std::cout << "PageTurnController: Page " << before << " is past the reported total of " << totalPages
                  << ", clamped to " << m_navigation.getCurrentPage() << std::endl;
    }
}

void PageTurnController::resetForDocument(int totalPages)
{
    m_accumulator.reset();
    m_scrollSettleTimer.cancel();
    m_atTop = true;
    m_atBottom = true;
    m_feedback.reset();
    m_gestures.touchCancel();
    m_navigation.cancelPageJumpInput();
    m_navigation.setPageCount(totalPages);
    m_navigation.setCurrentPage(1);
}

void PageTurnController::shutdown()
{
    m_accumulator.reset();
    m_scrollSettleTimer.cancel();
    m_feedback.reset();
    m_gestures.touchCancel();
    m_onPageTurn = nullptr;
}

bool PageTurnController::wheelReachesEdge(double deltaY, TimestampMs now) const
{
    if (isContentScrolling(now))
    {
        return false;
    }
    if (deltaY > 0.0)
    {
        return m_atBottom;
    }
    if (deltaY < 0.0)
    {
        return m_atTop;
    }
    return true; // Zero or NaN; the accumulator drops it
}

bool PageTurnController::handleWheel(double deltaY, WheelDeltaMode mode, TimestampMs now)
{
    if (!wheelReachesEdge(deltaY, now))
    {
        return false;
    }

    WheelOutcome outcome = m_accumulator.processWheel(deltaY, mode, now);
    if (outcome.ignored || outcome.absorbed)
    {
        return true;
    }

    if (outcome.fired)
    {
        // The gesture is consumed even when the clamp leaves nothing to turn to
        if (emitStep(outcome.direction, TurnSource::Wheel))
        {
            m_feedback.flashComplete(outcome.direction, now);
        }
        return true;
    }

    // No indicator for a direction that cannot move the page
    if (m_navigation.canStep(outcome.direction))
    {
        m_feedback.update(outcome.progress, outcome.direction, now);
    }
    return true;
}

void PageTurnController::setScrollEdges(bool atTop, bool atBottom)
{
    const bool wasAtEdge = m_atTop || m_atBottom;
    m_atTop = atTop;
    m_atBottom = atBottom;

    // A gesture still building up is dropped once the view scrolls away from the edge;
    // a turn that already fired keeps its cooldown
    const GestureState& gesture = m_accumulator.state();
    if (wasAtEdge && !atTop && !atBottom && gesture.direction != ScrollDirection::None &&
        !gesture.hasFiredThisGesture)
    {
        if (m_config.debugLogging)
        {
            std::cout << "PageTurnController: Left the scroll edge, dropping "
                      << toString(gesture.direction) << " gesture" << std::endl;
        }
        m_accumulator.reset();
        m_feedback.reset();
    }
}

void PageTurnController::handleContentScroll(bool atTop, bool atBottom, TimestampMs now)
{
    setScrollEdges(atTop, atBottom);
    m_scrollSettleTimer.restart(now, m_config.scrollSettleMs);
}

bool PageTurnController::handleTap(float x, float containerWidth)
{
    ScrollDirection direction = m_gestures.resolveTap(x, containerWidth);
    if (direction == ScrollDirection::None)
    {
        return false;
    }
    return emitStep(direction, TurnSource::Tap);
}

void PageTurnController::handleTouchStart(float x, TimestampMs now)
{
    m_gestures.touchStart(x, now);
}

void PageTurnController::handleTouchMove(float x)
{
    m_gestures.touchMove(x);
}

bool PageTurnController::handleTouchEnd(float x, TimestampMs now)
{
    ScrollDirection direction = m_gestures.touchEnd(x, now);
    if (direction == ScrollDirection::None)
    {
        return false;
    }
    return emitStep(direction, TurnSource::Swipe);
}

void PageTurnController::handleTouchCancel()
{
    m_gestures.touchCancel();
}

bool PageTurnController::handleKey(NavigationKey key, TimestampMs now)
{
    switch (key)
    {
    case NavigationKey::Next:
        return emitStep(ScrollDirection::Forward, TurnSource::Keyboard);

    case NavigationKey::Previous:
        return emitStep(ScrollDirection::Backward, TurnSource::Keyboard);

    case NavigationKey::First:
        if (auto target = m_navigation.resolveTarget(1))
        {
            return emitTarget(*target, ScrollDirection::None, TurnSource::Keyboard);
        }
        return false;

    case NavigationKey::Last:
        if (!m_navigation.isPageCountKnown())
        {
            std::cout << "PageTurnController: Last page unknown while the document is loading" << std::endl;
            return false;
        }
        if (auto target = m_navigation.resolveTarget(m_navigation.getPageCount()))
        {
            return emitTarget(*target, ScrollDirection::None, TurnSource::Keyboard);
        }
        return false;

    case NavigationKey::StartPageJump:
        m_navigation.startPageJumpInput(now);
        return false;

    case NavigationKey::ConfirmPageJump:
        if (auto target = m_navigation.confirmPageJumpInput(now))
        {
            return emitTarget(*target, ScrollDirection::None, TurnSource::PageJump);
        }
        return false;

    case NavigationKey::CancelPageJump:
        m_navigation.cancelPageJumpInput();
        return false;
    }

    return false;
}

bool PageTurnController::handlePageJumpDigit(char digit, TimestampMs now)
{
    return m_navigation.handlePageJumpInput(digit, now);
}

void PageTurnController::setClickNavigationEnabled(bool enabled)
{
    m_config.clickNavigationEnabled = enabled;
    m_gestures.setTapNavigationEnabled(enabled);
    std::cout << "PageTurnController: Click navigation " << (enabled ? "enabled" : "disabled") << std::endl;
}

void PageTurnController::tick(TimestampMs now)
{
    m_accumulator.tick(now);
    m_feedback.tick(now);
    m_scrollSettleTimer.poll(now);
    m_navigation.expirePageJumpInput(now);
}

bool PageTurnController::emitStep(ScrollDirection direction, TurnSource source)
{
    auto target = m_navigation.resolveStep(direction);
    if (!target)
    {
        if (m_config.debugLogging)
        {
            std::cout << "PageTurnController: " << toString(source) << " " << toString(direction)
                      << " turn clamped at page " << m_navigation.getCurrentPage() << std::endl;
        }
        return false;
    }
    return emitTarget(*target, direction, source);
}

bool PageTurnController::emitTarget(int targetPage, ScrollDirection direction, TurnSource source)
{
    m_navigation.commit(targetPage);
    ++m_turnCount;

    PageTurnIntent intent;
    intent.direction = direction;
    intent.targetPage = targetPage;
    intent.source = source;

    if (m_config.debugLogging)
    {
        std::cout << "PageTurnController: " << toString(source) << " -> page " << targetPage << std::endl;
    }

    if (m_onPageTurn)
    {
        m_onPageTurn(intent);
    }
    return true;
}
