#include "scroll_accumulator.h"

#include <algorithm>
#include <cmath>
#include <iostream>

ScrollAccumulator::ScrollAccumulator(const PageFlipConfig& config)
    : m_config(config),
      m_classifier(config.trackpadDeltaCutoff, config.pixelTrackpadDeltaCutoff),
      m_cooldown(config.cooldownMs)
{
}

void ScrollAccumulator::setConfig(const PageFlipConfig& config)
{
    m_config = config;
    m_classifier.setCutoffs(config.trackpadDeltaCutoff, config.pixelTrackpadDeltaCutoff);
    m_cooldown.setWindow(config.cooldownMs);
}

double ScrollAccumulator::contributionFor(double magnitude, DeviceGuess guess) const
{
    const DeviceProfile& profile = m_config.profileFor(guess);
    double scaled = std::fabs(magnitude) * profile.multiplier;
    return std::min(scaled, profile.perEventCap);
}

Uint32 ScrollAccumulator::idleDelay() const
{
    // The gap must exceed idleGapMs; an event exactly idleGapMs later still continues
    return m_config.idleGapMs + 1;
}

bool ScrollAccumulator::shouldReset(ScrollDirection direction, TimestampMs now) const
{
    if (direction != m_state.direction)
    {
        return true;
    }

    if (now > m_state.lastEventTimestamp && (now - m_state.lastEventTimestamp) > m_config.idleGapMs)
    {
        return true;
    }

    // A fired gesture is only released once its cooldown has run out
    return m_state.hasFiredThisGesture && !m_cooldown.isActive(now);
}

void ScrollAccumulator::beginGesture(ScrollDirection direction, double magnitude, WheelDeltaMode mode)
{
    m_state.accumulatedEnergy = 0.0;
    m_state.direction = direction;
    m_state.hasFiredThisGesture = false;
    m_state.isCoolingDown = false;
    m_state.deviceGuess = m_classifier.classify(magnitude, mode);
    m_cooldown.clear();
    m_cooldownTimer.cancel();

    if (m_config.debugLogging)
    {
        std::cout << "ScrollAccumulator: New " << toString(direction) << " gesture, device guess "
                  << toString(m_state.deviceGuess) << " (|deltaY|=" << magnitude << ")" << std::endl;
    }
}

WheelOutcome ScrollAccumulator::processWheel(double deltaY, WheelDeltaMode mode, TimestampMs now)
{
    WheelOutcome outcome;

    if (deltaY == 0.0 || !std::isfinite(deltaY))
    {
        outcome.ignored = true;
        return outcome;
    }

    // The guard may have run out since the last tick
    if (m_state.isCoolingDown && !isCoolingDown(now))
    {
        m_state.isCoolingDown = false;
    }

    const ScrollDirection direction = deltaY > 0.0 ? ScrollDirection::Forward : ScrollDirection::Backward;
    const double magnitude = std::fabs(deltaY);
    outcome.direction = direction;

    if (isCoolingDown(now))
    {
        // Trailing events of the gesture that already turned the page
        m_state.direction = direction;
        m_state.lastEventTimestamp = now;
        m_idleTimer.restart(now, idleDelay());
        outcome.absorbed = true;
        return outcome;
    }

    if (shouldReset(direction, now))
    {
        beginGesture(direction, magnitude, mode);
        outcome.startedGesture = true;
    }

    const double threshold = m_config.profileFor(m_state.deviceGuess).threshold;
    outcome.contribution = contributionFor(magnitude, m_state.deviceGuess);
    m_state.accumulatedEnergy += outcome.contribution;
    outcome.progress = static_cast<float>(std::min(100.0, m_state.accumulatedEnergy / threshold * 100.0));

    if (m_state.accumulatedEnergy >= threshold)
    {
        outcome.fired = true;
        outcome.progress = 100.0f;

        m_state.hasFiredThisGesture = true;
        m_state.isCoolingDown = true;
        m_state.lastTurnTimestamp = now;
        m_state.accumulatedEnergy = 0.0;
        m_cooldown.arm(now);
        m_cooldownTimer.restart(now, m_config.cooldownMs);

        if (m_config.debugLogging)
        {
            std::cout << "ScrollAccumulator: Threshold " << threshold << " reached, turning "
                      << toString(direction) << ", cooling down for " << m_config.cooldownMs << "ms" << std::endl;
        }
    }

    m_state.lastEventTimestamp = now;
    m_idleTimer.restart(now, idleDelay());
    return outcome;
}

bool ScrollAccumulator::tick(TimestampMs now)
{
    bool wasReset = false;

    if (m_cooldownTimer.poll(now))
    {
        m_state.isCoolingDown = false;
        if (!m_idleTimer.isArmed())
        {
            resetToIdle("cooldown elapsed");
            wasReset = true;
        }
    }

    if (m_idleTimer.poll(now))
    {
        if (!isCoolingDown(now))
        {
            resetToIdle("idle gap elapsed");
            wasReset = true;
        }
    }

    return wasReset;
}

void ScrollAccumulator::resetToIdle(const char* reason)
{
    if (m_config.debugLogging && m_state.direction != ScrollDirection::None)
    {
        std::cout << "ScrollAccumulator: Gesture reset (" << reason << "), dropped energy "
                  << m_state.accumulatedEnergy << std::endl;
    }

    m_state.accumulatedEnergy = 0.0;
    m_state.direction = ScrollDirection::None;
    m_state.hasFiredThisGesture = false;
    m_state.isCoolingDown = false;
    m_state.deviceGuess = DeviceGuess::Unknown;
    m_cooldown.clear();
}

void ScrollAccumulator::reset()
{
    m_idleTimer.cancel();
    m_cooldownTimer.cancel();
    resetToIdle("explicit reset");
    m_state.lastEventTimestamp = 0;
    m_state.lastTurnTimestamp = 0;
}

AccumulatorPhase ScrollAccumulator::phase(TimestampMs now) const
{
    if (isCoolingDown(now))
        return AccumulatorPhase::CoolingDown;
    if (m_state.direction != ScrollDirection::None && !m_state.hasFiredThisGesture)
        return AccumulatorPhase::Accumulating;
    return AccumulatorPhase::Idle;
}
