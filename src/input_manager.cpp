#include "input_manager.h"
#include "page_turn_controller.h"

#include <algorithm>
#include <cmath>
#include <iostream>

InputManager::InputManager(PageTurnController& controller, const PageFlipConfig& config)
    : m_controller(controller), m_config(config)
{
}

InputActionData InputManager::processEvent(const SDL_Event& event, TimestampMs now, int windowWidth, int windowHeight)
{
    (void) windowHeight; // Only horizontal geometry matters for tap zones and swipes
    InputActionData actionData;

    switch (event.type)
    {
    case SDL_QUIT:
        actionData.action = InputAction::Quit;
        break;

    case SDL_WINDOWEVENT:
        if (event.window.event == SDL_WINDOWEVENT_RESIZED ||
            event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED)
        {
            actionData.action = InputAction::Resize;
        }
        else if (event.window.event == SDL_WINDOWEVENT_FOCUS_LOST)
        {
            // A press or touch that started before the focus change will never see its release
            m_inputState.mousePressed = false;
            m_inputState.fingerTracking = false;
            m_inputState.activeFingers = 0;
            m_controller.handleTouchCancel();
        }
        break;

    case SDL_KEYDOWN:
        actionData = processKeyDown(event, now);
        break;

    case SDL_MOUSEWHEEL:
    {
        // Touch screens can synthesize wheel events; those go through the finger path
        if (event.wheel.which == SDL_TOUCH_MOUSEID)
            break;

        // Ctrl+wheel is zoom in most viewers; leave it alone
        if (SDL_GetModState() & KMOD_CTRL)
            break;

        double deltaY = 0.0;
        WheelDeltaMode mode = WheelDeltaMode::Line;
        if (translateWheel(event.wheel, deltaY, mode))
        {
            if (m_controller.handleWheel(deltaY, mode, now))
            {
                actionData.action = InputAction::Redraw;
                actionData.consumedByController = true;
            }
            else
            {
                actionData.action = InputAction::ScrollContent;
                actionData.scrollDeltaY = deltaY;
            }
        }
        break;
    }

    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP:
    case SDL_MOUSEMOTION:
        actionData = processMouse(event, windowWidth);
        break;

    case SDL_FINGERDOWN:
    case SDL_FINGERMOTION:
    case SDL_FINGERUP:
        actionData = processFinger(event, now, windowWidth);
        break;
    }

    return actionData;
}

bool InputManager::translateWheel(const SDL_MouseWheelEvent& wheel, double& deltaY, WheelDeltaMode& mode) const
{
#if SDL_VERSION_ATLEAST(2, 0, 18)
    double notches = static_cast<double>(wheel.preciseY);
#else
    double notches = static_cast<double>(wheel.y);
#endif
    if (notches == 0.0)
    {
        return false;
    }

    if (wheel.direction == SDL_MOUSEWHEEL_FLIPPED)
    {
        notches = -notches;
    }

    // Whole notches come from a clicky wheel; fractional ones from high-resolution
    // devices that deliver pixel-precise deltas
    mode = (notches == std::trunc(notches)) ? WheelDeltaMode::Line : WheelDeltaMode::Pixel;

    // SDL reports "away from the user" as positive; forward (next page) is towards the user
    deltaY = -notches * m_config.pixelsPerWheelNotch;
    return true;
}

InputActionData InputManager::processKeyDown(const SDL_Event& event, TimestampMs now)
{
    InputActionData actionData;
    const bool pageJumpActive = m_controller.navigation().isPageJumpInputActive();
    const SDL_Keycode key = event.key.keysym.sym;

    if (pageJumpActive)
    {
        char digit = 0;
        if (key >= SDLK_0 && key <= SDLK_9)
        {
            digit = static_cast<char>('0' + (key - SDLK_0));
        }
        else if (key >= SDLK_KP_1 && key <= SDLK_KP_9)
        {
            digit = static_cast<char>('1' + (key - SDLK_KP_1));
        }
        else if (key == SDLK_KP_0)
        {
            digit = '0';
        }

        if (digit != 0)
        {
            m_controller.handlePageJumpDigit(digit, now);
            actionData.action = InputAction::Redraw;
            actionData.consumedByController = true;
            return actionData;
        }
    }

    switch (key)
    {
    case SDLK_ESCAPE:
    case SDLK_q:
        if (pageJumpActive)
        {
            m_controller.handleKey(NavigationKey::CancelPageJump, now);
            actionData.action = InputAction::Redraw;
            actionData.consumedByController = true;
        }
        else
        {
            actionData.action = InputAction::Quit;
        }
        break;

    case SDLK_RIGHT:
    case SDLK_PAGEDOWN:
    case SDLK_SPACE:
        m_controller.handleKey(NavigationKey::Next, now);
        actionData.consumedByController = true;
        break;

    case SDLK_LEFT:
    case SDLK_PAGEUP:
        m_controller.handleKey(NavigationKey::Previous, now);
        actionData.consumedByController = true;
        break;

    case SDLK_HOME:
        m_controller.handleKey(NavigationKey::First, now);
        actionData.consumedByController = true;
        break;

    case SDLK_END:
        m_controller.handleKey(NavigationKey::Last, now);
        actionData.consumedByController = true;
        break;

    case SDLK_g:
        m_controller.handleKey(NavigationKey::StartPageJump, now);
        actionData.action = InputAction::Redraw;
        actionData.consumedByController = true;
        break;

    case SDLK_RETURN:
    case SDLK_KP_ENTER:
        if (pageJumpActive)
        {
            m_controller.handleKey(NavigationKey::ConfirmPageJump, now);
            actionData.action = InputAction::Redraw;
            actionData.consumedByController = true;
        }
        break;

    case SDLK_f:
        actionData.action = InputAction::ToggleFullscreen;
        break;

    case SDLK_c:
        actionData.action = InputAction::ToggleClickNavigation;
        break;

    case SDLK_p:
        actionData.action = InputAction::PrintAppState;
        break;
    }

    return actionData;
}

InputActionData InputManager::processMouse(const SDL_Event& event, int windowWidth)
{
    InputActionData actionData;

    switch (event.type)
    {
    case SDL_MOUSEBUTTONDOWN:
        // Touch input is handled as fingers; ignore the mouse events SDL synthesizes from it
        if (event.button.which == SDL_TOUCH_MOUSEID || event.button.button != SDL_BUTTON_LEFT)
            break;

        m_inputState.mousePressed = true;
        m_inputState.pressX = static_cast<float>(event.button.x);
        m_inputState.pressY = static_cast<float>(event.button.y);
        m_inputState.maxTravel = 0.0f;
        break;

    case SDL_MOUSEMOTION:
        if (event.motion.which == SDL_TOUCH_MOUSEID || !m_inputState.mousePressed)
            break;

        m_inputState.maxTravel = std::max(m_inputState.maxTravel,
                                          std::hypot(static_cast<float>(event.motion.x) - m_inputState.pressX,
                                                     static_cast<float>(event.motion.y) - m_inputState.pressY));
        break;

    case SDL_MOUSEBUTTONUP:
    {
        if (event.button.which == SDL_TOUCH_MOUSEID || event.button.button != SDL_BUTTON_LEFT)
            break;
        if (!m_inputState.mousePressed)
            break;

        m_inputState.mousePressed = false;
        float travel = std::max(m_inputState.maxTravel,
                                std::hypot(static_cast<float>(event.button.x) - m_inputState.pressX,
                                           static_cast<float>(event.button.y) - m_inputState.pressY));

        // A drag is not a tap
        if (travel > m_config.tapSlopPx)
            break;

        m_controller.handleTap(static_cast<float>(event.button.x), static_cast<float>(windowWidth));
        actionData.consumedByController = true;
        break;
    }
    }

    return actionData;
}

InputActionData InputManager::processFinger(const SDL_Event& event, TimestampMs now, int windowWidth)
{
    InputActionData actionData;
    const float x = event.tfinger.x * static_cast<float>(windowWidth);

    switch (event.type)
    {
    case SDL_FINGERDOWN:
        ++m_inputState.activeFingers;
        if (m_inputState.activeFingers == 1)
        {
            m_inputState.fingerTracking = true;
            m_inputState.trackedFinger = event.tfinger.fingerId;
            m_controller.handleTouchStart(x, now);
        }
        else if (m_inputState.fingerTracking)
        {
            // Multi-finger gestures (pinch) are not page turns
            m_inputState.fingerTracking = false;
            m_controller.handleTouchCancel();
        }
        break;

    case SDL_FINGERMOTION:
        if (m_inputState.fingerTracking && event.tfinger.fingerId == m_inputState.trackedFinger)
        {
            m_controller.handleTouchMove(x);
        }
        break;

    case SDL_FINGERUP:
        m_inputState.activeFingers = std::max(0, m_inputState.activeFingers - 1);
        if (m_inputState.fingerTracking && event.tfinger.fingerId == m_inputState.trackedFinger)
        {
            m_inputState.fingerTracking = false;
            m_controller.handleTouchEnd(x, now);
            actionData.consumedByController = true;
        }
        break;
    }

    return actionData;
}
