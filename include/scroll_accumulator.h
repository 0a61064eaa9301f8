#ifndef SCROLL_ACCUMULATOR_H
#define SCROLL_ACCUMULATOR_H

#include "config_manager.h"
#include "cooldown_guard.h"
#include "deadline_timer.h"
#include "gesture_types.h"
#include "input_classifier.h"

/**
 * @brief Per-gesture state of the wheel/trackpad accumulator
 */
struct GestureState
{
    double accumulatedEnergy = 0.0; // Scaled input since the last reset, always >= 0
    ScrollDirection direction = ScrollDirection::None;
    TimestampMs lastEventTimestamp = 0;
    TimestampMs lastTurnTimestamp = 0;
    bool hasFiredThisGesture = false;
    bool isCoolingDown = false;
    DeviceGuess deviceGuess = DeviceGuess::Unknown;
};

enum class AccumulatorPhase
{
    Idle,
    Accumulating,
    CoolingDown
};

/**
 * @brief What a single wheel event did to the accumulator
 */
struct WheelOutcome
{
    bool ignored = false;       // Zero or non-finite delta, nothing changed
    bool absorbed = false;      // Arrived during cooldown; only timestamps were updated
    bool startedGesture = false; // This event reset the accumulator and re-ran the classifier
    bool fired = false;         // Threshold crossed: one page turn in `direction`
    ScrollDirection direction = ScrollDirection::None;
    double contribution = 0.0;  // Scaled and capped amount added to the energy
    float progress = 0.0f;      // 0..100 towards the device threshold
};

/**
 * @brief Converts bursty wheel/trackpad deltas into at most one turn per gesture
 *
 * A gesture is a run of same-direction events with no pause longer than the idle
 * gap. Energy is accumulated with device-dependent scaling and a per-event cap;
 * crossing the device threshold fires one turn and arms the cooldown guard, which
 * absorbs the trailing events of the same physical gesture.
 */
class ScrollAccumulator
{
public:
    explicit ScrollAccumulator(const PageFlipConfig& config = PageFlipConfig());
    ~ScrollAccumulator() = default;

    void setConfig(const PageFlipConfig& config);

    /**
     * @brief Feed one wheel event
     * @param deltaY Signed delta, positive scrolls forward
     * @param mode Unit of deltaY
     * @param now Monotonic time of the event in milliseconds
     */
    WheelOutcome processWheel(double deltaY, WheelDeltaMode mode, TimestampMs now);

    /**
     * @brief Poll the idle-gap and cooldown timers; call once per loop iteration
     * @return true if the gesture was reset to Idle by a timer
     */
    bool tick(TimestampMs now);

    /**
     * @brief Drop the current gesture and cancel all pending timers
     */
    void reset();

    const GestureState& state() const
    {
        return m_state;
    }
    AccumulatorPhase phase(TimestampMs now) const;
    bool isCoolingDown(TimestampMs now) const
    {
        return m_state.hasFiredThisGesture && m_cooldown.isActive(now);
    }
    Uint32 cooldownRemainingMs(TimestampMs now) const
    {
        return m_state.hasFiredThisGesture ? m_cooldown.remainingMs(now) : 0;
    }
    bool hasPendingTimers() const
    {
        return m_idleTimer.isArmed() || m_cooldownTimer.isArmed();
    }

    /**
     * @brief Scaled and capped contribution of a raw delta for the given device
     */
    double contributionFor(double magnitude, DeviceGuess guess) const;

private:
    void beginGesture(ScrollDirection direction, double magnitude, WheelDeltaMode mode);
    void resetToIdle(const char* reason);
    bool shouldReset(ScrollDirection direction, TimestampMs now) const;
    Uint32 idleDelay() const;

    PageFlipConfig m_config;
    InputClassifier m_classifier;
    CooldownGuard m_cooldown;
    GestureState m_state;

    DeadlineTimer m_idleTimer;     // Ends the gesture after idleGapMs without input
    DeadlineTimer m_cooldownTimer; // Clears isCoolingDown when the guard window elapses
};

#endif // SCROLL_ACCUMULATOR_H
