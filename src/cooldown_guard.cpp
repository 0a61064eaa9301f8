#include "cooldown_guard.h"

CooldownGuard::CooldownGuard(Uint32 windowMs)
    : m_windowMs(windowMs)
{
}

void CooldownGuard::arm(TimestampMs now)
{
    m_armedAt = now;
    m_armed = true;
}

void CooldownGuard::clear()
{
    m_armed = false;
    m_armedAt = 0;
}

bool CooldownGuard::isActive(TimestampMs now) const
{
    if (!m_armed)
        return false;

    // Timestamps earlier than the arm time come from a stale clock; treat as still cooling
    if (now < m_armedAt)
        return true;

    return (now - m_armedAt) < m_windowMs;
}

Uint32 CooldownGuard::remainingMs(TimestampMs now) const
{
    if (!isActive(now))
        return 0;
    if (now < m_armedAt)
        return m_windowMs;
    return static_cast<Uint32>(m_windowMs - (now - m_armedAt));
}
