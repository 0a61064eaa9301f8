#include "render_manager.h"
#include "page_turn_controller.h"
#include "text_renderer.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

RenderManager::RenderManager(SDL_Window* window, SDL_Renderer* renderer, const PageFlipConfig& config)
    : m_window(window), m_renderer(renderer), m_config(config)
{
}

RenderManager::~RenderManager() = default;

bool RenderManager::initialize()
{
    if (m_config.fontPath.empty())
    {
        std::cout << "RenderManager: No font configured, overlays will be drawn without text" << std::endl;
        return false;
    }

    try
    {
        m_textRenderer = std::make_unique<TextRenderer>(m_renderer, m_config.fontPath, 18);
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "RenderManager: Text rendering disabled: " << e.what() << std::endl;
        m_textRenderer.reset();
        return false;
    }

    std::cout << "RenderManager: Using font " << m_config.fontPath << std::endl;
    return true;
}

bool RenderManager::updateOverlayTimers(TimestampMs now)
{
    if (m_state.pageDisplayActive && now - m_state.pageDisplayTime >= RenderState::PAGE_DISPLAY_DURATION)
    {
        m_state.pageDisplayActive = false;
        return true;
    }
    return false;
}

void RenderManager::renderFrame(const PageTurnController& controller, int displayedPage, int totalPages,
                                int scrollY, int contentHeight, TimestampMs now)
{
    (void) now;
    int windowWidth = 0;
    int windowHeight = 0;
    SDL_GetRendererOutputSize(m_renderer, &windowWidth, &windowHeight);

    SDL_SetRenderDrawColor(m_renderer, 60, 60, 64, 255);
    SDL_RenderClear(m_renderer);

    renderPlaceholderPage(displayedPage, scrollY, std::max(contentHeight, windowHeight), windowWidth, windowHeight);

    if (m_state.pageDisplayActive)
    {
        renderPageInfo(displayedPage, totalPages, windowWidth, windowHeight);
    }

    if (m_config.showReadingProgressBar)
    {
        renderReadingProgressBar(controller, windowWidth, windowHeight);
    }

    if (m_config.showFeedbackOverlay)
    {
        renderFeedbackIndicator(controller, windowWidth, windowHeight);
    }

    if (controller.navigation().isPageJumpInputActive())
    {
        renderPageJumpInput(controller, windowWidth, windowHeight);
    }
}

void RenderManager::renderPlaceholderPage(int displayedPage, int scrollY, int contentHeight, int windowWidth, int windowHeight)
{
    // Stand-in for the page rendering engine: a sheet with the page number
    int margin = std::max(20, std::min(windowWidth, windowHeight) / 12);
    int sheetHeight = contentHeight - 2 * margin;
    int sheetWidth = std::min(windowWidth - 2 * margin, (windowHeight - 2 * margin) * 3 / 4);
    int sheetX = (windowWidth - sheetWidth) / 2;
    int sheetY = margin - scrollY;

    fillRect(sheetX, sheetY, sheetWidth, sheetHeight, {250, 248, 240, 255});
    outlineRect(sheetX, sheetY, sheetWidth, sheetHeight, {30, 30, 30, 255});

    // Faux text lines, only the visible ones
    int lineY = sheetY + (windowHeight - 2 * margin) / 6;
    for (int i = 0; lineY < sheetY + sheetHeight - 40 && lineY < windowHeight; ++i)
    {
        if (lineY > -6)
        {
            int lineWidth = sheetWidth - 60 - ((i * 37 + displayedPage * 13) % 80);
            fillRect(sheetX + 30, lineY, lineWidth, 6, {200, 200, 200, 255});
        }
        lineY += 24;
    }

    if (m_textRenderer)
    {
        m_textRenderer->setFontSize(300);
        m_textRenderer->renderTextCentered(std::to_string(displayedPage), windowWidth / 2, sheetY + 20, {40, 40, 40, 255});
        m_textRenderer->setFontSize(100);
    }
}

void RenderManager::renderPageInfo(int displayedPage, int totalPages, int windowWidth, int windowHeight)
{
    std::string pageInfo = "Page " + std::to_string(displayedPage) + "/" +
                           (totalPages > 0 ? std::to_string(totalPages) : std::string("?"));
    (void) windowHeight;
    renderTextWithBackground(pageInfo, windowWidth / 2, 12);
}

void RenderManager::renderFeedbackIndicator(const PageTurnController& controller, int windowWidth, int windowHeight)
{
    const FeedbackState& feedback = controller.feedback();
    if (!feedback.visible)
    {
        return;
    }

    int barWidth = 200, barHeight = 20;
    int indicatorX = (windowWidth - barWidth) / 2;
    int indicatorY = feedback.direction == ScrollDirection::Backward ? 60 : windowHeight - 70;

    SDL_Color fillColor = {107, 114, 128, 255}; // Building
    switch (controller.feedbackBand())
    {
    case FeedbackBand::Ready:
        fillColor = {16, 185, 129, 255};
        break;
    case FeedbackBand::Almost:
        fillColor = {59, 130, 246, 255};
        break;
    case FeedbackBand::Building:
        break;
    }

    std::string label = std::string(feedback.direction == ScrollDirection::Backward ? "Previous Page" : "Next Page") +
                        " - " + FeedbackEmitter::labelFor(controller.feedbackBand());
    renderTextWithBackground(label, windowWidth / 2, indicatorY - 44);

    renderProgressBar(indicatorX, indicatorY, barWidth, barHeight, feedback.progress / 100.0f,
                      {50, 50, 50, 200}, fillColor);
}

void RenderManager::renderReadingProgressBar(const PageTurnController& controller, int windowWidth, int windowHeight)
{
    const NavigationManager& navigation = controller.navigation();
    if (!navigation.isPageCountKnown())
    {
        return;
    }

    int barHeight = 6;
    float progress = navigation.readingProgressPercent() / 100.0f;
    renderProgressBar(0, windowHeight - barHeight, windowWidth, barHeight, progress,
                      {20, 20, 20, 160}, {99, 102, 241, 255});
}

void RenderManager::renderPageJumpInput(const PageTurnController& controller, int windowWidth, int windowHeight)
{
    const NavigationManager& navigation = controller.navigation();
    std::string prompt = "Go to page: " + navigation.getPageJumpBuffer() + "_";
    if (navigation.isPageCountKnown())
    {
        prompt += " (1-" + std::to_string(navigation.getPageCount()) + ")";
    }
    renderTextWithBackground(prompt, windowWidth / 2, windowHeight / 2 - 20);
}

void RenderManager::fillRect(int x, int y, int width, int height, SDL_Color color)
{
    SDL_Rect rect = {x, y, width, height};
    SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(m_renderer, color.r, color.g, color.b, color.a);
    SDL_RenderFillRect(m_renderer, &rect);
}

void RenderManager::outlineRect(int x, int y, int width, int height, SDL_Color color)
{
    SDL_Rect rect = {x, y, width, height};
    SDL_SetRenderDrawColor(m_renderer, color.r, color.g, color.b, color.a);
    SDL_RenderDrawRect(m_renderer, &rect);
}

void RenderManager::renderProgressBar(int x, int y, int width, int height, float progress, SDL_Color bgColor, SDL_Color fillColor)
{
    progress = std::clamp(progress, 0.0f, 1.0f);

    fillRect(x, y, width, height, bgColor);
    fillRect(x, y, static_cast<int>(width * progress), height, fillColor);
    outlineRect(x, y, width, height, {255, 255, 255, 255});
}

void RenderManager::renderTextWithBackground(const std::string& text, int centerX, int y)
{
    if (!m_textRenderer)
    {
        return;
    }

    int textWidth = 0;
    int textHeight = 0;
    if (!m_textRenderer->measureText(text, textWidth, textHeight))
    {
        return;
    }

    int textPadding = 10;
    int textX = centerX - textWidth / 2;
    fillRect(textX - textPadding, y - textPadding, textWidth + 2 * textPadding, textHeight + 2 * textPadding, {0, 0, 0, 180});
    outlineRect(textX - textPadding, y - textPadding, textWidth + 2 * textPadding, textHeight + 2 * textPadding, {255, 255, 255, 255});
    m_textRenderer->renderText(text, textX, y, {255, 255, 255, 255});
}

void RenderManager::present()
{
    SDL_RenderPresent(m_renderer);
}
