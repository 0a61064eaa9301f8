#include "path_utils.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace
{
std::filesystem::path resolveStateDirectory()
{
    if (const char* stateDir = std::getenv("PAGEFLIP_STATE_DIR"))
    {
        if (stateDir[0] != '\0')
        {
            return std::filesystem::path(stateDir);
        }
    }

    if (const char* home = std::getenv("HOME"))
    {
        if (home[0] != '\0')
        {
            return std::filesystem::path(home) / ".pageflip";
        }
    }

    return std::filesystem::current_path();
}
} // namespace

std::filesystem::path getStateDirectory()
{
    std::filesystem::path stateDir = resolveStateDirectory();
    std::error_code ec;
    std::filesystem::create_directories(stateDir, ec);
    if (ec)
    {
        std::cerr << "PathUtils: Could not create state directory " << stateDir << ": " << ec.message() << std::endl;
    }
    return stateDir;
}

std::filesystem::path getDefaultConfigPath()
{
    return getStateDirectory() / "config.json";
}
