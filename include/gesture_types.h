#ifndef GESTURE_TYPES_H
#define GESTURE_TYPES_H

#include <SDL_stdinc.h>

/**
 * @brief Direction of a page turn or of a continuous scroll gesture
 */
enum class ScrollDirection
{
    None,     // At rest
    Forward,  // Next page (positive deltaY, leftward swipe, right tap zone)
    Backward  // Previous page
};

/**
 * @brief Heuristic guess of the device producing wheel events
 */
enum class DeviceGuess
{
    Unknown,
    Wheel,
    Trackpad
};

/**
 * @brief Unit of a wheel delta: pixels, lines or whole pages
 */
enum class WheelDeltaMode
{
    Pixel,
    Line,
    Page
};

/**
 * @brief Which input path produced a page turn
 */
enum class TurnSource
{
    Wheel,
    Swipe,
    Tap,
    Keyboard,
    PageJump
};

/**
 * @brief "Go to page N" request emitted by the controller
 */
struct PageTurnIntent
{
    ScrollDirection direction = ScrollDirection::None; // None for absolute jumps
    int targetPage = 1;                                 // 1-based, already clamped
    TurnSource source = TurnSource::Wheel;
};

/**
 * @brief Snapshot consumed by the progress indicator overlay
 */
struct FeedbackState
{
    bool visible = false;
    float progress = 0.0f; // 0..100
    ScrollDirection direction = ScrollDirection::None;
};

// Monotonic milliseconds (SDL_GetTicks64 in the shell)
using TimestampMs = Uint64;

const char* toString(ScrollDirection direction);
const char* toString(DeviceGuess guess);
const char* toString(TurnSource source);

#endif // GESTURE_TYPES_H
