#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include "gesture_types.h"
#include "path_utils.h"

#include <string>

/**
 * @brief Per-device scaling applied to raw wheel deltas
 */
struct DeviceProfile
{
    double multiplier = 1.0; // Applied to |deltaY|
    double perEventCap = 0.0; // Upper bound of a single event's contribution
    double threshold = 0.0;   // Accumulated energy needed for one page turn
};

/**
 * @brief Tunable knobs of the page-turn controller and the viewer shell
 */
struct PageFlipConfig
{
    // Gesture timing
    Uint32 idleGapMs = 200;     // Pause that ends a continuous gesture
    Uint32 cooldownMs = 800;    // Suppression window after an accumulated turn
    Uint32 feedbackFadeMs = 500; // Indicator lingers this long after the last update
    Uint32 scrollSettleMs = 150; // Wheel input is left to the page while its own scroll settles

    // Scroll edges
    float scrollEdgeThresholdPx = 5.0f; // Scroll offset within this of an end counts as at the edge

    // Input classification
    double trackpadDeltaCutoff = 4.0;       // |deltaY| below this is a trackpad in any mode
    double pixelTrackpadDeltaCutoff = 50.0; // Pixel-mode |deltaY| below this is a trackpad
    double pixelsPerWheelNotch = 100.0;     // SDL wheel units to pixel-equivalent deltas

    DeviceProfile trackpad{2.5, 10.0, 250.0};
    DeviceProfile wheel{0.8, 50.0, 150.0};

    // Discrete gestures
    float swipeThresholdPx = 50.0f;
    Uint32 swipeMaxDurationMs = 0; // 0 disables the duration limit
    float tapSlopPx = 8.0f;        // Max pointer travel for a press/release to count as a tap
    bool clickNavigationEnabled = false;

    // Feedback
    float feedbackNoiseFloor = 5.0f; // Percent; indicator stays hidden at or below this

    // Shell
    bool showFeedbackOverlay = true;
    bool showReadingProgressBar = true;
    std::string fontPath;
    bool debugLogging = false;

    const DeviceProfile& profileFor(DeviceGuess guess) const
    {
        return guess == DeviceGuess::Trackpad ? trackpad : wheel;
    }
};

/**
 * @brief Loads, validates and persists PageFlipConfig as a small JSON file
 */
class ConfigManager
{
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    /**
     * @brief Save configuration to file
     * @param config Configuration to save
     * @param configPath Optional override path (defaults to the state directory)
     * @return true if successful, false otherwise
     */
    bool saveConfig(const PageFlipConfig& config, std::string configPath = {}) const;

    /**
     * @brief Load configuration from file
     * @param configPath Optional override path (defaults to the state directory)
     * @return Loaded configuration, or defaults if the file is missing or unreadable
     */
    PageFlipConfig loadConfig(std::string configPath = {}) const;

    /**
     * @brief Clamp nonsensical values back into a usable range
     * @return true if any value had to be changed
     */
    static bool sanitize(PageFlipConfig& config);

    static std::string toJson(const PageFlipConfig& config);
    static PageFlipConfig fromJson(const std::string& json);
};

#endif // CONFIG_MANAGER_H
