#ifndef INPUT_CLASSIFIER_H
#define INPUT_CLASSIFIER_H

#include "gesture_types.h"

/**
 * @brief Guesses trackpad vs. mouse wheel from the magnitude of a wheel delta
 *
 * This is an approximation: there is no portable API that reports the physical
 * device behind a wheel event, so small or pixel-precise deltas are taken as a
 * trackpad and everything else as a notched wheel.
 */
class InputClassifier
{
public:
    InputClassifier(double trackpadDeltaCutoff = 4.0, double pixelTrackpadDeltaCutoff = 50.0);

    void setCutoffs(double trackpadDeltaCutoff, double pixelTrackpadDeltaCutoff)
    {
        m_trackpadDeltaCutoff = trackpadDeltaCutoff;
        m_pixelTrackpadDeltaCutoff = pixelTrackpadDeltaCutoff;
    }

    /**
     * @brief Classify the first event of a gesture
     * @param magnitude |deltaY| of the event
     * @param mode Unit the delta was delivered in
     * @return Trackpad or Wheel, never Unknown
     */
    DeviceGuess classify(double magnitude, WheelDeltaMode mode) const;

private:
    double m_trackpadDeltaCutoff;
    double m_pixelTrackpadDeltaCutoff;
};

#endif // INPUT_CLASSIFIER_H
