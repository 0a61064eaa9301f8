#ifndef DEADLINE_TIMER_H
#define DEADLINE_TIMER_H

#include "gesture_types.h"

/**
 * @brief Single-shot timer slot polled from the event loop
 *
 * Holds at most one pending deadline. restart() always replaces the previous
 * deadline, so a callback scheduled for an older gesture can never fire
 * against newer state. The owner calls poll() once per loop iteration.
 */
class DeadlineTimer
{
public:
    DeadlineTimer() = default;

    void restart(TimestampMs now, Uint32 delayMs)
    {
        m_deadline = now + delayMs;
        m_armed = true;
    }

    void cancel()
    {
        m_armed = false;
    }

    bool isArmed() const
    {
        return m_armed;
    }

    TimestampMs deadline() const
    {
        return m_deadline;
    }

    /**
     * @brief Fire the slot if its deadline has been reached
     * @return true exactly once per restart(), on the first poll at or after the deadline
     */
    bool poll(TimestampMs now)
    {
        if (m_armed && now >= m_deadline)
        {
            m_armed = false;
            return true;
        }
        return false;
    }

private:
    TimestampMs m_deadline = 0;
    bool m_armed = false;
};

#endif // DEADLINE_TIMER_H
