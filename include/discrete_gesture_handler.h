#ifndef DISCRETE_GESTURE_HANDLER_H
#define DISCRETE_GESTURE_HANDLER_H

#include "gesture_types.h"

/**
 * @brief Tap-zone and horizontal swipe recognition
 *
 * Both gestures are already deliberate, so they resolve to a direction
 * immediately and never go through the accumulator or the cooldown.
 */
class DiscreteGestureHandler
{
public:
    DiscreteGestureHandler(float swipeThresholdPx = 50.0f, Uint32 swipeMaxDurationMs = 0);

    void configure(float swipeThresholdPx, Uint32 swipeMaxDurationMs)
    {
        m_swipeThresholdPx = swipeThresholdPx;
        m_swipeMaxDurationMs = swipeMaxDurationMs;
    }

    // Tap zones
    void setTapNavigationEnabled(bool enabled)
    {
        m_tapNavigationEnabled = enabled;
    }
    bool isTapNavigationEnabled() const
    {
        return m_tapNavigationEnabled;
    }

    /**
     * @brief Map a tap to a direction by the half of the view it landed in
     * @param x Horizontal tap position relative to the container
     * @param containerWidth Width of the viewing area
     * @return Backward for the left half, Forward for the right half, None if disabled
     */
    ScrollDirection resolveTap(float x, float containerWidth) const;

    // Swipe tracking
    void touchStart(float x, TimestampMs now);
    void touchMove(float x);

    /**
     * @brief Finish the tracked touch
     * @param x Horizontal position where the finger was lifted
     * @return Forward for a leftward swipe, Backward for a rightward one, None otherwise
     */
    ScrollDirection touchEnd(float x, TimestampMs now);
    void touchCancel();

    bool isTracking() const
    {
        return m_tracking;
    }

private:
    float m_swipeThresholdPx;
    Uint32 m_swipeMaxDurationMs;
    bool m_tapNavigationEnabled = false;

    bool m_tracking = false;
    bool m_moved = false;
    float m_startX = 0.0f;
    float m_lastX = 0.0f;
    TimestampMs m_startTime = 0;
};

#endif // DISCRETE_GESTURE_HANDLER_H
