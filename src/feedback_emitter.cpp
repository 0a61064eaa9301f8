#include "feedback_emitter.h"

#include <algorithm>

FeedbackEmitter::FeedbackEmitter(float noiseFloor, Uint32 fadeMs)
    : m_noiseFloor(noiseFloor), m_fadeMs(fadeMs)
{
}

void FeedbackEmitter::update(float progress, ScrollDirection direction, TimestampMs now)
{
    m_state.progress = std::clamp(progress, 0.0f, 100.0f);
    m_state.direction = direction;

    // Small progress is noise; only reveal the indicator once past the floor
    if (m_state.progress > m_noiseFloor)
    {
        m_state.visible = true;
    }

    m_hideTimer.restart(now, m_fadeMs);
}

void FeedbackEmitter::flashComplete(ScrollDirection direction, TimestampMs now)
{
    m_state.progress = 100.0f;
    m_state.direction = direction;
    m_state.visible = true;
    m_hideTimer.restart(now, m_fadeMs);
}

bool FeedbackEmitter::tick(TimestampMs now)
{
    if (!m_hideTimer.poll(now))
        return false;

    bool wasVisible = m_state.visible;
    m_state = FeedbackState();
    return wasVisible;
}

void FeedbackEmitter::reset()
{
    m_hideTimer.cancel();
    m_state = FeedbackState();
}

FeedbackBand FeedbackEmitter::band() const
{
    if (m_state.progress >= 100.0f)
        return FeedbackBand::Ready;
    if (m_state.progress >= 75.0f)
        return FeedbackBand::Almost;
    return FeedbackBand::Building;
}

const char* FeedbackEmitter::labelFor(FeedbackBand band)
{
    return band == FeedbackBand::Ready ? "Ready" : "Keep scrolling";
}
