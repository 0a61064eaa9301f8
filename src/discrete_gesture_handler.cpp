#include "discrete_gesture_handler.h"

DiscreteGestureHandler::DiscreteGestureHandler(float swipeThresholdPx, Uint32 swipeMaxDurationMs)
    : m_swipeThresholdPx(swipeThresholdPx), m_swipeMaxDurationMs(swipeMaxDurationMs)
{
}

ScrollDirection DiscreteGestureHandler::resolveTap(float x, float containerWidth) const
{
    if (!m_tapNavigationEnabled || containerWidth <= 0.0f)
    {
        return ScrollDirection::None;
    }

    return x < containerWidth / 2.0f ? ScrollDirection::Backward : ScrollDirection::Forward;
}

void DiscreteGestureHandler::touchStart(float x, TimestampMs now)
{
    m_tracking = true;
    m_moved = false;
    m_startX = x;
    m_lastX = x;
    m_startTime = now;
}

void DiscreteGestureHandler::touchMove(float x)
{
    if (!m_tracking)
        return;

    m_lastX = x;
    m_moved = true;
}

ScrollDirection DiscreteGestureHandler::touchEnd(float x, TimestampMs now)
{
    if (!m_tracking)
        return ScrollDirection::None;

    m_tracking = false;

    // The lift position counts even when no motion was reported
    if (x != m_lastX)
    {
        m_lastX = x;
        m_moved = true;
    }

    // A touch that never moved is a tap, not a swipe
    if (!m_moved)
        return ScrollDirection::None;

    if (m_swipeMaxDurationMs > 0 && now > m_startTime && (now - m_startTime) > m_swipeMaxDurationMs)
        return ScrollDirection::None;

    float distance = m_startX - m_lastX;
    if (distance > m_swipeThresholdPx)
        return ScrollDirection::Forward;
    if (distance < -m_swipeThresholdPx)
        return ScrollDirection::Backward;

    return ScrollDirection::None;
}

void DiscreteGestureHandler::touchCancel()
{
    m_tracking = false;
    m_moved = false;
}
