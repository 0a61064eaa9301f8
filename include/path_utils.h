#ifndef PATH_UTILS_H
#define PATH_UTILS_H

#include <filesystem>

/**
 * @brief Returns the directory used to persist viewer state (config).
 *        Ensures the directory exists. Respects PAGEFLIP_STATE_DIR, falling back
 *        to $HOME/.pageflip and finally the working directory.
 */
std::filesystem::path getStateDirectory();

/**
 * @brief Convenience accessor for the default config file path.
 */
std::filesystem::path getDefaultConfigPath();

#endif // PATH_UTILS_H
