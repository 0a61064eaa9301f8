#ifndef COOLDOWN_GUARD_H
#define COOLDOWN_GUARD_H

#include "gesture_types.h"

/**
 * @brief Suppresses further accumulated page turns for a fixed window
 *
 * Expiry is purely time based: no input event clears the guard early.
 */
class CooldownGuard
{
public:
    explicit CooldownGuard(Uint32 windowMs = 800);

    void setWindow(Uint32 windowMs)
    {
        m_windowMs = windowMs;
    }

    void arm(TimestampMs now);
    void clear();

    bool isActive(TimestampMs now) const;
    Uint32 remainingMs(TimestampMs now) const;

private:
    Uint32 m_windowMs;
    TimestampMs m_armedAt = 0;
    bool m_armed = false;
};

#endif // COOLDOWN_GUARD_H
