#ifndef APP_H
#define APP_H

#include "config_manager.h"
#include "gesture_types.h"
#include "input_manager.h"
#include "page_turn_controller.h"
#include "render_manager.h"

#include <SDL.h>
#include <memory>
#include <string>

/**
 * @brief Startup options collected from the command line
 */
struct AppOptions
{
    PageFlipConfig config;
    std::string configPath; // Empty: default state directory
    int totalPages = 20;    // 0: total unknown at startup
    int startPage = 1;
    int revealTotal = 0;    // Total that becomes known later when totalPages is 0
    double pageLength = 1.0; // Page height in window heights; longer pages scroll
    bool saveConfig = false;

    static constexpr Uint32 REVEAL_DELAY_MS = 2000;
};

class App
{
public:
    // Constructor accepts pre-initialized SDL_Window* and SDL_Renderer*
    App(const AppOptions& options, SDL_Window* window, SDL_Renderer* renderer);
    ~App();

    void run();

private:
    // Event Handling
    void handleEvent(const SDL_Event& event, TimestampMs now);
    void processInputAction(const InputActionData& actionData);

    // Simulated reader
    void applyPageTurn(const PageTurnIntent& intent);
    void updateRevealedTotal(TimestampMs now);

    // In-page scrolling
    void scrollContent(double deltaY, TimestampMs now);
    void syncScrollEdges();
    int viewportHeight() const;
    int contentHeight() const;

    // Window management
    void toggleFullscreen();
    void toggleClickNavigation();

    // State Management
    void printAppState();
    void markDirty();

    SDL_Window* m_window;
    SDL_Renderer* m_renderer;

    AppOptions m_options;
    PageFlipConfig m_config;

    std::unique_ptr<PageTurnController> m_controller;
    std::unique_ptr<InputManager> m_inputManager;
    std::unique_ptr<RenderManager> m_renderManager;

    // Position of the simulated page renderer; the controller's view may run ahead of it
    int m_displayedPage = 1;
    int m_knownTotal = 0;
    int m_documentPages = 0; // Real size of the simulated document, 0 if unbounded
    int m_scrollY = 0;

    bool m_running = true;
    bool m_isFullscreen = false;
    TimestampMs m_startTime = 0;
};

#endif // APP_H
