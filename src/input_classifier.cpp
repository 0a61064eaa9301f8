#include "input_classifier.h"

#include <cmath>

InputClassifier::InputClassifier(double trackpadDeltaCutoff, double pixelTrackpadDeltaCutoff)
    : m_trackpadDeltaCutoff(trackpadDeltaCutoff), m_pixelTrackpadDeltaCutoff(pixelTrackpadDeltaCutoff)
{
}

DeviceGuess InputClassifier::classify(double magnitude, WheelDeltaMode mode) const
{
    magnitude = std::fabs(magnitude);

    if (magnitude < m_trackpadDeltaCutoff)
    {
        return DeviceGuess::Trackpad;
    }

    if (mode == WheelDeltaMode::Pixel && magnitude < m_pixelTrackpadDeltaCutoff)
    {
        return DeviceGuess::Trackpad;
    }

    return DeviceGuess::Wheel;
}
