#include "gesture_types.h"

const char* toString(ScrollDirection direction)
{
    switch (direction)
    {
    case ScrollDirection::Forward:
        return "Forward";
    case ScrollDirection::Backward:
        return "Backward";
    case ScrollDirection::None:
        break;
    }
    return "None";
}

const char* toString(DeviceGuess guess)
{
    switch (guess)
    {
    case DeviceGuess::Wheel:
        return "Wheel";
    case DeviceGuess::Trackpad:
        return "Trackpad";
    case DeviceGuess::Unknown:
        break;
    }
    return "Unknown";
}

const char* toString(TurnSource source)
{
    switch (source)
    {
    case TurnSource::Wheel:
        return "Wheel";
    case TurnSource::Swipe:
        return "Swipe";
    case TurnSource::Tap:
        return "Tap";
    case TurnSource::Keyboard:
        return "Keyboard";
    case TurnSource::PageJump:
        return "PageJump";
    }
    return "Unknown";
}
