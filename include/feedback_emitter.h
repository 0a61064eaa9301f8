#ifndef FEEDBACK_EMITTER_H
#define FEEDBACK_EMITTER_H

#include "deadline_timer.h"
#include "gesture_types.h"

/**
 * @brief Colour band of the progress indicator
 */
enum class FeedbackBand
{
    Building, // Below 75%
    Almost,   // 75% and up
    Ready     // Turn fired / threshold reached
};

/**
 * @brief Drives the "how close am I to a page turn" indicator
 *
 * The indicator has its own fade timer, independent of the accumulator's idle
 * gap, so it lingers briefly after a turn completes.
 */
class FeedbackEmitter
{
public:
    FeedbackEmitter(float noiseFloor = 5.0f, Uint32 fadeMs = 500);

    void configure(float noiseFloor, Uint32 fadeMs)
    {
        m_noiseFloor = noiseFloor;
        m_fadeMs = fadeMs;
    }

    /**
     * @brief Report accumulator progress
     * @param progress 0..100, values outside are clamped
     * @param direction Direction the gesture is heading
     * @param now Current time in milliseconds
     */
    void update(float progress, ScrollDirection direction, TimestampMs now);

    /**
     * @brief Show a full indicator to confirm a completed turn
     */
    void flashComplete(ScrollDirection direction, TimestampMs now);

    /**
     * @brief Hide the indicator once the fade delay has elapsed
     * @return true if the indicator was hidden by this call
     */
    bool tick(TimestampMs now);

    void reset();

    const FeedbackState& state() const
    {
        return m_state;
    }
    FeedbackBand band() const;
    static const char* labelFor(FeedbackBand band);
    bool hasPendingTimer() const
    {
        return m_hideTimer.isArmed();
    }

private:
    float m_noiseFloor;
    Uint32 m_fadeMs;
    FeedbackState m_state;
    DeadlineTimer m_hideTimer;
};

#endif // FEEDBACK_EMITTER_H
