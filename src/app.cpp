#include "app.h"

#include <algorithm>
#include <cmath>
#include <iostream>

// --- App Class ---

App::App(const AppOptions& options, SDL_Window* window, SDL_Renderer* renderer)
    : m_window(window), m_renderer(renderer), m_options(options), m_config(options.config)
{
    m_documentPages = options.totalPages > 0 ? options.totalPages : options.revealTotal;
    m_knownTotal = std::max(0, options.totalPages);
    m_displayedPage = std::max(1, options.startPage);
    if (m_documentPages > 0)
    {
        m_displayedPage = std::min(m_displayedPage, m_documentPages);
    }

    m_controller = std::make_unique<PageTurnController>(m_config);
    m_controller->setReaderPosition(m_displayedPage, m_knownTotal);
    m_controller->setPageTurnCallback([this](const PageTurnIntent& intent)
                                      { applyPageTurn(intent); });

    m_inputManager = std::make_unique<InputManager>(*m_controller, m_config);

    m_renderManager = std::make_unique<RenderManager>(m_window, m_renderer, m_config);
    if (!m_renderManager->initialize())
    {
        std::cout << "App: Continuing without overlay text" << std::endl;
    }

    syncScrollEdges();

    std::cout << "App: Simulated document with "
              << (m_knownTotal > 0 ? std::to_string(m_knownTotal) : std::string("unknown"))
              << " pages, starting at page " << m_displayedPage << std::endl;
}

App::~App()
{
    if (m_controller)
    {
        m_controller->shutdown();
    }

    if (m_options.saveConfig)
    {
        ConfigManager configManager;
        if (!configManager.saveConfig(m_config, m_options.configPath))
        {
            std::cerr << "App: Failed to save configuration" << std::endl;
        }
    }
}

void App::run()
{
    m_startTime = SDL_GetTicks64();
    TimestampMs lastRenderTime = 0;

    SDL_Event event;
    while (m_running)
    {
        while (SDL_PollEvent(&event) != 0)
        {
            handleEvent(event, SDL_GetTicks64());
        }

        TimestampMs now = SDL_GetTicks64();

        bool feedbackWasVisible = m_controller->feedback().visible;
        bool jumpWasActive = m_controller->navigation().isPageJumpInputActive();
        m_controller->tick(now);
        if (feedbackWasVisible != m_controller->feedback().visible ||
            jumpWasActive != m_controller->navigation().isPageJumpInputActive())
        {
            markDirty();
        }

        updateRevealedTotal(now);

        if (m_renderManager->updateOverlayTimers(now))
        {
            markDirty();
        }

        // Frame pacing: redraw on change, otherwise at a low idle rate
        bool shouldRender = m_renderManager->needsRedraw() || (now - lastRenderTime) >= 250;
        if (shouldRender)
        {
            m_renderManager->renderFrame(*m_controller, m_displayedPage, m_knownTotal, m_scrollY, contentHeight(), now);
            m_renderManager->present();
            m_renderManager->clearDirtyFlag();
            lastRenderTime = now;
        }
        else
        {
            SDL_Delay(1);
        }
    }
}

void App::handleEvent(const SDL_Event& event, TimestampMs now)
{
    int windowWidth = 0;
    int windowHeight = 0;
    SDL_GetWindowSize(m_window, &windowWidth, &windowHeight);

    InputActionData actionData = m_inputManager->processEvent(event, now, windowWidth, windowHeight);
    if (actionData.consumedByController)
    {
        markDirty();
    }
    if (actionData.action == InputAction::ScrollContent)
    {
        scrollContent(actionData.scrollDeltaY, now);
    }
    processInputAction(actionData);
}

void App::processInputAction(const InputActionData& actionData)
{
    switch (actionData.action)
    {
    case InputAction::None:
        break;
    case InputAction::Quit:
        m_running = false;
        break;
    case InputAction::Resize:
        syncScrollEdges();
        markDirty();
        break;
    case InputAction::ScrollContent:
    case InputAction::Redraw:
        markDirty();
        break;
    case InputAction::ToggleFullscreen:
        toggleFullscreen();
        break;
    case InputAction::ToggleClickNavigation:
        toggleClickNavigation();
        break;
    case InputAction::PrintAppState:
        printAppState();
        break;
    }
}

void App::applyPageTurn(const PageTurnIntent& intent)
{
    // The renderer owns the real position; reject targets it cannot show and
    // resynchronise the controller's optimistic copy
    if (intent.targetPage < 1 || (m_documentPages > 0 && intent.targetPage > m_documentPages))
    {
        std::cerr << "App: Rejected page turn to " << intent.targetPage
                  << " (" << toString(intent.source) << ")" << std::endl;
        m_controller->setReaderPosition(m_displayedPage, m_knownTotal);
        return;
    }

    std::cout << "App: Page turn (" << toString(intent.source) << ", " << toString(intent.direction)
              << ") " << m_displayedPage << " -> " << intent.targetPage << std::endl;

    m_displayedPage = intent.targetPage;
    m_scrollY = 0;
    syncScrollEdges();
    m_renderManager->updatePageDisplayTime(SDL_GetTicks64());
    markDirty();
}

int App::viewportHeight() const
{
    int width = 0;
    int height = 0;
    SDL_GetRendererOutputSize(m_renderer, &width, &height);
    return height;
}

int App::contentHeight() const
{
    return static_cast<int>(std::lround(viewportHeight() * m_options.pageLength));
}

void App::scrollContent(double deltaY, TimestampMs now)
{
    int maxScroll = std::max(0, contentHeight() - viewportHeight());
    int scrollY = std::clamp(m_scrollY + static_cast<int>(std::lround(deltaY)), 0, maxScroll);
    if (scrollY == m_scrollY)
    {
        return;
    }

    m_scrollY = scrollY;
    float edge = m_config.scrollEdgeThresholdPx;
    m_controller->handleContentScroll(m_scrollY <= edge, m_scrollY + viewportHeight() >= contentHeight() - edge, now);
    markDirty();
}

void App::syncScrollEdges()
{
    int viewport = viewportHeight();
    int content = contentHeight();
    m_scrollY = std::clamp(m_scrollY, 0, std::max(0, content - viewport));

    float edge = m_config.scrollEdgeThresholdPx;
    m_controller->setScrollEdges(m_scrollY <= edge, m_scrollY + viewport >= content - edge);
}

void App::updateRevealedTotal(TimestampMs now)
{
    if (m_knownTotal > 0 || m_options.revealTotal <= 0)
    {
        return;
    }
    if (now - m_startTime < AppOptions::REVEAL_DELAY_MS)
    {
        return;
    }

    m_knownTotal = m_options.revealTotal;
    m_displayedPage = std::min(m_displayedPage, m_knownTotal);
    m_controller->setReaderPosition(m_displayedPage, m_knownTotal);
    std::cout << "App: Page count now known: " << m_knownTotal << std::endl;
    markDirty();
}

void App::toggleFullscreen()
{
    Uint32 fullscreenFlag = m_isFullscreen ? 0 : SDL_WINDOW_FULLSCREEN_DESKTOP;
    if (SDL_SetWindowFullscreen(m_window, fullscreenFlag) < 0)
    {
        std::cerr << "Error toggling fullscreen: " << SDL_GetError() << std::endl;
    }
    else
    {
        m_isFullscreen = !m_isFullscreen;
    }
    markDirty();
}

void App::toggleClickNavigation()
{
    m_config.clickNavigationEnabled = !m_controller->isClickNavigationEnabled();
    m_controller->setClickNavigationEnabled(m_config.clickNavigationEnabled);
    m_inputManager->setConfig(m_config);
    std::cout << "App: Click navigation " << (m_config.clickNavigationEnabled ? "enabled" : "disabled") << std::endl;
}

void App::markDirty()
{
    if (m_renderManager)
    {
        m_renderManager->markDirty();
    }
}

void App::printAppState()
{
    TimestampMs now = SDL_GetTicks64();
    const GestureState& gesture = m_controller->gestureState();
    const FeedbackState& feedback = m_controller->feedback();

    std::cout << "--- App State ---" << std::endl;
    std::cout << "Displayed Page: " << m_displayedPage << "/"
              << (m_knownTotal > 0 ? std::to_string(m_knownTotal) : std::string("?")) << std::endl;
    std::cout << "Turns Emitted: " << m_controller->turnCount() << std::endl;
    std::cout << "Gesture: energy=" << gesture.accumulatedEnergy
              << " direction=" << toString(gesture.direction)
              << " device=" << toString(gesture.deviceGuess)
              << " fired=" << (gesture.hasFiredThisGesture ? "yes" : "no")
              << " coolingDown=" << (m_controller->isCoolingDown(now) ? "yes" : "no");
    if (m_controller->isCoolingDown(now))
    {
        std::cout << " (" << m_controller->cooldownRemainingMs(now) << "ms left)";
    }
    std::cout << std::endl;
    switch (m_controller->accumulatorPhase(now))
    {
    case AccumulatorPhase::Idle:
        std::cout << "Accumulator: Idle" << std::endl;
        break;
    case AccumulatorPhase::Accumulating:
        std::cout << "Accumulator: Accumulating" << std::endl;
        break;
    case AccumulatorPhase::CoolingDown:
        std::cout << "Accumulator: Cooling down" << std::endl;
        break;
    }
    std::cout << "Scroll: " << m_scrollY << "/" << std::max(0, contentHeight() - viewportHeight())
              << " atTop=" << (m_controller->isAtTopEdge() ? "yes" : "no")
              << " atBottom=" << (m_controller->isAtBottomEdge() ? "yes" : "no")
              << " settling=" << (m_controller->isContentScrolling(now) ? "yes" : "no") << std::endl;
    std::cout << "Feedback: visible=" << (feedback.visible ? "yes" : "no")
              << " progress=" << feedback.progress << "%" << std::endl;
    std::cout << "Click Navigation: " << (m_controller->isClickNavigationEnabled() ? "on" : "off") << std::endl;

    int windowWidth = 0;
    int windowHeight = 0;
    SDL_GetWindowSize(m_window, &windowWidth, &windowHeight);
    std::cout << "Window Dimensions: " << windowWidth << "x" << windowHeight << std::endl;

    // Also print navigation state
    m_controller->navigation().printNavigationState();
    std::cout << "-----------------" << std::endl;
}
