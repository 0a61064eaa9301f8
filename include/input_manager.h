#ifndef INPUT_MANAGER_H
#define INPUT_MANAGER_H

#include "config_manager.h"
#include "gesture_types.h"

#include <SDL.h>

class PageTurnController;

/**
 * @brief Shell-level actions that can be triggered by input events
 *
 * Page turns are not listed here: they reach the App through the controller's
 * page-turn callback.
 */
enum class InputAction
{
    None,
    Quit,
    Resize,
    ToggleFullscreen,
    ToggleClickNavigation,
    PrintAppState,
    ScrollContent, // Wheel input the controller left for the page itself
    Redraw // Controller state changed (feedback, page jump buffer)
};

/**
 * @brief Structure to hold input action data
 */
struct InputActionData
{
    InputAction action = InputAction::None;
    bool consumedByController = false; // Event was forwarded to the page-turn controller
    double scrollDeltaY = 0.0;         // ScrollContent: pixels, positive scrolls down
};

/**
 * @brief Translates SDL events into PageTurnController calls
 */
class InputManager
{
public:
    InputManager(PageTurnController& controller, const PageFlipConfig& config);
    ~InputManager() = default;

    void setConfig(const PageFlipConfig& config)
    {
        m_config = config;
    }

    /**
     * @brief Process SDL event and forward it to the controller
     * @param event SDL event to process
     * @param now Monotonic time in milliseconds
     * @param windowWidth Current width of the viewing area in pixels
     * @param windowHeight Current height of the viewing area in pixels
     * @return InputActionData with the shell action, if any
     */
    InputActionData processEvent(const SDL_Event& event, TimestampMs now, int windowWidth, int windowHeight);

    /**
     * @brief Convert an SDL wheel event into a signed (deltaY, deltaMode) pair
     * @return false if the event carries no vertical movement
     */
    bool translateWheel(const SDL_MouseWheelEvent& wheel, double& deltaY, WheelDeltaMode& mode) const;

    /**
     * @brief Get current pointer state for UI purposes
     */
    struct InputState
    {
        bool mousePressed = false;
        float pressX = 0.0f;
        float pressY = 0.0f;
        float maxTravel = 0.0f;

        bool fingerTracking = false;
        SDL_FingerID trackedFinger = 0;
        int activeFingers = 0;
    };

    const InputState& getInputState() const
    {
        return m_inputState;
    }

private:
    PageTurnController& m_controller;
    PageFlipConfig m_config;
    InputState m_inputState;

    // Helper methods
    InputActionData processKeyDown(const SDL_Event& event, TimestampMs now);
    InputActionData processMouse(const SDL_Event& event, int windowWidth);
    InputActionData processFinger(const SDL_Event& event, TimestampMs now, int windowWidth);
};

#endif // INPUT_MANAGER_H
