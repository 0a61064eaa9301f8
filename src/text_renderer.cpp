#include "text_renderer.h"
#include <algorithm> // For std::max
#include <iostream>
#include <stdexcept> // For std::runtime_error

// --- TextRenderer Class ---

TextRenderer::TextRenderer(SDL_Renderer* renderer, const std::string& fontPath, int fontSize)
    : m_sdlRenderer(renderer), m_fontPath(fontPath), m_baseFontSize(fontSize), m_currentFontSize(0)
{
    if (TTF_WasInit() == 0 && TTF_Init() == -1)
    {
        throw std::runtime_error("SDL_ttf could not initialize! TTF_Error: " + std::string(TTF_GetError()));
    }

    setFontSize(100);
}

TextRenderer::~TextRenderer()
{
    // TTF_Quit() is left to main's cleanup
}

// Re-opens the font if the scaled size differs from the current one.
void TextRenderer::setFontSize(int scale)
{
    int newFontSize = static_cast<int>(m_baseFontSize * (scale / 100.0));
    newFontSize = std::max(8, newFontSize); // Minimum font size of 8 pixels

    if (!m_font || newFontSize != m_currentFontSize)
    {
        if (m_font)
        {
            // Close the previous font before opening a new size to avoid leaking file handles.
            m_font.reset();
        }

        m_font.reset(TTF_OpenFont(m_fontPath.c_str(), newFontSize));
        if (!m_font)
        {
            std::cerr << "Error: Failed to load font: " << m_fontPath << " at size: " << newFontSize << "! TTF_Error: " << TTF_GetError() << std::endl;
            // As a fallback, try to load the font at its base size.
            m_font.reset(TTF_OpenFont(m_fontPath.c_str(), m_baseFontSize));
            if (!m_font)
            {
                throw std::runtime_error("Failed to load font: " + m_fontPath + " at base size after error!");
            }
            m_currentFontSize = m_baseFontSize;
        }
        else
        {
            m_currentFontSize = newFontSize;
        }
    }
}

void TextRenderer::renderText(const std::string& text, int x, int y, SDL_Color color)
{
    if (text.empty())
        return;
    if (!m_font)
    {
        std::cerr << "Error: Font not loaded for rendering text." << std::endl;
        return;
    }

    std::unique_ptr<SDL_Surface, void (*)(SDL_Surface*)> textSurface(
        TTF_RenderUTF8_Blended(m_font.get(), text.c_str(), color),
        SDL_FreeSurface);
    if (!textSurface)
    {
        std::cerr << "Error: Unable to render text surface! TTF_Error: " << TTF_GetError() << std::endl;
        return;
    }

    std::unique_ptr<SDL_Texture, SDL_Texture_Deleter> textTexture(
        SDL_CreateTextureFromSurface(m_sdlRenderer, textSurface.get()));
    if (!textTexture)
    {
        std::cerr << "Error: Unable to create texture from rendered text! SDL_Error: " << SDL_GetError() << std::endl;
        return;
    }

    SDL_Rect renderQuad = {x, y, textSurface->w, textSurface->h};

    SDL_RenderCopy(m_sdlRenderer, textTexture.get(), NULL, &renderQuad);
}

bool TextRenderer::measureText(const std::string& text, int& width, int& height) const
{
    width = 0;
    height = 0;
    if (text.empty() || !m_font)
    {
        return false;
    }

    if (TTF_SizeUTF8(m_font.get(), text.c_str(), &width, &height) != 0)
    {
        std::cerr << "Error: Unable to measure text! TTF_Error: " << TTF_GetError() << std::endl;
        width = 0;
        height = 0;
        return false;
    }

    return true;
}

void TextRenderer::renderTextCentered(const std::string& text, int centerX, int y, SDL_Color color)
{
    int width = 0;
    int height = 0;
    if (!measureText(text, width, height))
        return;

    renderText(text, centerX - width / 2, y, color);
}
