#include "app.h"
#include "config_manager.h"
#include "path_utils.h"
#include <SDL.h>
#include <SDL_ttf.h>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace
{

void printUsage(const char* program)
{
    std::cerr << "Usage: " << program << " [--pages N] [--start P] [--config PATH] [--click-nav]"
              << " [--save-config] [--reveal-total N] [--page-length X] [--debug]" << std::endl;
    std::cerr << "       --pages 0 starts with an unknown page count" << std::endl;
    std::cerr << "       --page-length 2.5 makes each page two and a half windows tall" << std::endl;
}

bool parseInt(const char* text, int& value)
{
    char* end = nullptr;
    long parsed = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || parsed < 0 || parsed > 1000000)
    {
        return false;
    }
    value = static_cast<int>(parsed);
    return true;
}

bool parseLength(const char* text, double& value)
{
    char* end = nullptr;
    double parsed = std::strtod(text, &end);
    if (end == text || *end != '\0' || !(parsed >= 1.0 && parsed <= 100.0))
    {
        return false;
    }
    value = parsed;
    return true;
}

void cleanupSDL(SDL_Window* window, SDL_Renderer* renderer)
{
    if (renderer)
    {
        SDL_DestroyRenderer(renderer);
    }
    if (window)
    {
        SDL_DestroyWindow(window);
    }
    if (TTF_WasInit())
    {
        TTF_Quit();
    }
    SDL_Quit();
}

} // namespace

int main(int argc, char* argv[])
{
    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    int returnCode = 0;

    AppOptions options;
    bool clickNav = false;
    bool debug = false;

    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (std::strcmp(arg, "--pages") == 0 && hasValue)
        {
            if (!parseInt(argv[++i], options.totalPages))
            {
                std::cerr << "Invalid page count: " << argv[i] << std::endl;
                return 1;
            }
        }
        else if (std::strcmp(arg, "--start") == 0 && hasValue)
        {
            if (!parseInt(argv[++i], options.startPage) || options.startPage < 1)
            {
                std::cerr << "Invalid start page: " << argv[i] << std::endl;
                return 1;
            }
        }
        else if (std::strcmp(arg, "--reveal-total") == 0 && hasValue)
        {
            if (!parseInt(argv[++i], options.revealTotal))
            {
                std::cerr << "Invalid page count: " << argv[i] << std::endl;
                return 1;
            }
        }
        else if (std::strcmp(arg, "--page-length") == 0 && hasValue)
        {
            if (!parseLength(argv[++i], options.pageLength))
            {
                std::cerr << "Invalid page length: " << argv[i] << std::endl;
                return 1;
            }
        }
        else if (std::strcmp(arg, "--config") == 0 && hasValue)
        {
            options.configPath = argv[++i];
        }
        else if (std::strcmp(arg, "--click-nav") == 0)
        {
            clickNav = true;
        }
        else if (std::strcmp(arg, "--save-config") == 0)
        {
            options.saveConfig = true;
        }
        else if (std::strcmp(arg, "--debug") == 0)
        {
            debug = true;
        }
        else
        {
            printUsage(argv[0]);
            return 1;
        }
    }

    // Load config, then apply command-line overrides
    ConfigManager configManager;
    options.config = configManager.loadConfig(options.configPath);
    if (clickNav)
    {
        options.config.clickNavigationEnabled = true;
    }
    if (debug)
    {
        options.config.debugLogging = true;
    }
    std::cout << "Main: Config path: "
              << (options.configPath.empty() ? getDefaultConfigPath().string() : options.configPath) << std::endl;

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) < 0)
    {
        std::cerr << "SDL could not initialize! SDL_Error: " << SDL_GetError() << std::endl;
        cleanupSDL(window, renderer);
        return 1;
    }

    if (TTF_Init() == -1)
    {
        std::cerr << "SDL_ttf could not initialize! TTF_Error: " << TTF_GetError() << std::endl;
        cleanupSDL(window, renderer);
        return 1;
    }

    window = SDL_CreateWindow(
        "PageFlip",
        SDL_WINDOWPOS_UNDEFINED,
        SDL_WINDOWPOS_UNDEFINED,
        800,
        600,
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window)
    {
        std::cerr << "Window could not be created! SDL_Error: " << SDL_GetError() << std::endl;
        cleanupSDL(window, renderer);
        return 1;
    }

    renderer = SDL_CreateRenderer(
        window,
        -1,
        SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer)
    {
        std::cerr << "Renderer could not be created! SDL_Error: " << SDL_GetError() << std::endl;
        cleanupSDL(window, renderer);
        return 1;
    }

    try
    {
        App app(options, window, renderer);
        std::cout << "Main: App instance created, calling run()" << std::endl;
        app.run();
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "Application Error: " << e.what() << std::endl;
        returnCode = 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        returnCode = 1;
    }

    cleanupSDL(window, renderer);

    return returnCode;
}
