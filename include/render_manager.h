#ifndef RENDER_MANAGER_H
#define RENDER_MANAGER_H

#include "config_manager.h"
#include "gesture_types.h"

#include <SDL.h>
#include <memory>
#include <string>

// Forward declarations
class PageTurnController;
class TextRenderer;

/**
 * @brief Structure to hold render state and timing information
 */
struct RenderState
{
    bool needsRedraw = true; // Flag to indicate when screen needs to be redrawn

    // UI display timers
    TimestampMs pageDisplayTime = 0;
    bool pageDisplayActive = false;

    // UI display durations
    static constexpr Uint32 PAGE_DISPLAY_DURATION = 2000; // 2 seconds
};

/**
 * @brief Draws the placeholder page and the overlays driven by the controller
 */
class RenderManager
{
public:
    RenderManager(SDL_Window* window, SDL_Renderer* renderer, const PageFlipConfig& config);
    ~RenderManager();

    // Initialization; returns false if text rendering is unavailable (bars still draw)
    bool initialize();

    void setConfig(const PageFlipConfig& config)
    {
        m_config = config;
        markDirty();
    }

    /**
     * @brief Render one frame
     * @param controller Source of feedback, navigation and page jump state
     * @param displayedPage Page the (simulated) renderer is showing
     * @param totalPages Page count known to the renderer, 0 if unknown
     * @param scrollY Vertical scroll offset into the page in pixels
     * @param contentHeight Full height of the page in pixels
     * @param now Current time in milliseconds
     */
    void renderFrame(const PageTurnController& controller, int displayedPage, int totalPages,
                     int scrollY, int contentHeight, TimestampMs now);

    // Render state management
    void markDirty()
    {
        m_state.needsRedraw = true;
    }
    bool needsRedraw() const
    {
        return m_state.needsRedraw;
    }
    void clearDirtyFlag()
    {
        m_state.needsRedraw = false;
    }

    // Page indicator overlay timing
    void updatePageDisplayTime(TimestampMs now)
    {
        m_state.pageDisplayTime = now;
        m_state.pageDisplayActive = true;
    }

    /**
     * @brief Expire timed overlays
     * @return true if something disappeared and the frame must be redrawn
     */
    bool updateOverlayTimers(TimestampMs now);

    void present();

private:
    SDL_Window* m_window;
    SDL_Renderer* m_renderer;
    std::unique_ptr<TextRenderer> m_textRenderer;
    PageFlipConfig m_config;
    RenderState m_state;

    // UI rendering methods
    void renderPlaceholderPage(int displayedPage, int scrollY, int contentHeight, int windowWidth, int windowHeight);
    void renderPageInfo(int displayedPage, int totalPages, int windowWidth, int windowHeight);
    void renderFeedbackIndicator(const PageTurnController& controller, int windowWidth, int windowHeight);
    void renderReadingProgressBar(const PageTurnController& controller, int windowWidth, int windowHeight);
    void renderPageJumpInput(const PageTurnController& controller, int windowWidth, int windowHeight);

    // Helper methods
    void fillRect(int x, int y, int width, int height, SDL_Color color);
    void outlineRect(int x, int y, int width, int height, SDL_Color color);
    void renderProgressBar(int x, int y, int width, int height, float progress, SDL_Color bgColor, SDL_Color fillColor);
    void renderTextWithBackground(const std::string& text, int centerX, int y);
};

#endif // RENDER_MANAGER_H
