#include "config_manager.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>

// Flat key/value JSON, written and scanned by hand
namespace
{
std::string escapeJsonString(const std::string& value)
{
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value)
    {
        if (c == '"' || c == '\\')
        {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

/**
 * @brief Locate the raw text following "key": in a flat JSON object
 * @return Position of the first value character, or npos if the key is absent
 */
size_t findValueStart(const std::string& json, const std::string& key)
{
    const std::string quotedKey = "\"" + key + "\"";
    size_t pos = json.find(quotedKey);
    if (pos == std::string::npos)
        return std::string::npos;

    pos = json.find_first_not_of(" \t\r\n", pos + quotedKey.length());
    if (pos == std::string::npos || json[pos] != ':')
        return std::string::npos;

    return json.find_first_not_of(" \t\r\n", pos + 1);
}

std::optional<std::string> findStringValue(const std::string& json, const std::string& key)
{
    size_t start = findValueStart(json, key);
    if (start == std::string::npos || json[start] != '"')
        return std::nullopt;

    std::string value;
    for (size_t i = start + 1; i < json.size(); ++i)
    {
        char c = json[i];
        if (c == '\\' && i + 1 < json.size())
        {
            value += json[++i];
        }
        else if (c == '"')
        {
            return value;
        }
        else
        {
            value += c;
        }
    }
    return std::nullopt; // Unterminated string
}

std::optional<std::string> findScalarToken(const std::string& json, const std::string& key)
{
    size_t start = findValueStart(json, key);
    if (start == std::string::npos)
        return std::nullopt;

    size_t end = json.find_first_of(",}\r\n", start);
    std::string token = json.substr(start, end == std::string::npos ? std::string::npos : end - start);
    size_t last = token.find_last_not_of(" \t");
    if (last == std::string::npos)
        return std::nullopt;
    return token.substr(0, last + 1);
}

std::optional<double> findNumberValue(const std::string& json, const std::string& key)
{
    auto token = findScalarToken(json, key);
    if (!token)
        return std::nullopt;

    try
    {
        size_t consumed = 0;
        double value = std::stod(*token, &consumed);
        if (consumed != token->size() || !std::isfinite(value))
        {
            std::cerr << "ConfigManager: Ignoring malformed number for '" << key << "': " << *token << std::endl;
            return std::nullopt;
        }
        return value;
    }
    catch (const std::exception&)
    {
        std::cerr << "ConfigManager: Ignoring malformed number for '" << key << "': " << *token << std::endl;
        return std::nullopt;
    }
}

std::optional<bool> findBoolValue(const std::string& json, const std::string& key)
{
    auto token = findScalarToken(json, key);
    if (!token)
        return std::nullopt;
    if (*token == "true")
        return true;
    if (*token == "false")
        return false;

    std::cerr << "ConfigManager: Ignoring malformed boolean for '" << key << "': " << *token << std::endl;
    return std::nullopt;
}

void readMs(const std::string& json, const std::string& key, Uint32& target)
{
    if (auto value = findNumberValue(json, key))
    {
        // Negative timings clamp to zero
        target = *value < 0.0 ? 0u : static_cast<Uint32>(*value);
    }
}

void readDouble(const std::string& json, const std::string& key, double& target)
{
    if (auto value = findNumberValue(json, key))
        target = *value;
}

void readFloat(const std::string& json, const std::string& key, float& target)
{
    if (auto value = findNumberValue(json, key))
        target = static_cast<float>(*value);
}

void readBool(const std::string& json, const std::string& key, bool& target)
{
    if (auto value = findBoolValue(json, key))
        target = *value;
}

bool clampAtLeast(double& value, double minimum, const char* name)
{
    if (value < minimum)
    {
        std::cerr << "ConfigManager: " << name << " " << value << " out of range, using " << minimum << std::endl;
        value = minimum;
        return true;
    }
    return false;
}

bool sanitizeProfile(DeviceProfile& profile, const DeviceProfile& fallback, const char* name)
{
    bool changed = false;
    if (profile.multiplier <= 0.0)
    {
        std::cerr << "ConfigManager: " << name << " multiplier must be positive, using " << fallback.multiplier << std::endl;
        profile.multiplier = fallback.multiplier;
        changed = true;
    }
    if (profile.perEventCap <= 0.0)
    {
        std::cerr << "ConfigManager: " << name << " per-event cap must be positive, using " << fallback.perEventCap << std::endl;
        profile.perEventCap = fallback.perEventCap;
        changed = true;
    }
    if (profile.threshold <= 0.0)
    {
        std::cerr << "ConfigManager: " << name << " threshold must be positive, using " << fallback.threshold << std::endl;
        profile.threshold = fallback.threshold;
        changed = true;
    }
    return changed;
}
} // namespace

std::string ConfigManager::toJson(const PageFlipConfig& config)
{
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"idleGapMs\": " << config.idleGapMs << ",\n";
    oss << "  \"cooldownMs\": " << config.cooldownMs << ",\n";
    oss << "  \"feedbackFadeMs\": " << config.feedbackFadeMs << ",\n";
    oss << "  \"scrollSettleMs\": " << config.scrollSettleMs << ",\n";
    oss << "  \"scrollEdgeThresholdPx\": " << config.scrollEdgeThresholdPx << ",\n";
    oss << "  \"trackpadDeltaCutoff\": " << config.trackpadDeltaCutoff << ",\n";
    oss << "  \"pixelTrackpadDeltaCutoff\": " << config.pixelTrackpadDeltaCutoff << ",\n";
    oss << "  \"pixelsPerWheelNotch\": " << config.pixelsPerWheelNotch << ",\n";
    oss << "  \"trackpadMultiplier\": " << config.trackpad.multiplier << ",\n";
    oss << "  \"trackpadCap\": " << config.trackpad.perEventCap << ",\n";
    oss << "  \"trackpadThreshold\": " << config.trackpad.threshold << ",\n";
    oss << "  \"wheelMultiplier\": " << config.wheel.multiplier << ",\n";
    oss << "  \"wheelCap\": " << config.wheel.perEventCap << ",\n";
    oss << "  \"wheelThreshold\": " << config.wheel.threshold << ",\n";
    oss << "  \"swipeThresholdPx\": " << config.swipeThresholdPx << ",\n";
    oss << "  \"swipeMaxDurationMs\": " << config.swipeMaxDurationMs << ",\n";
    oss << "  \"tapSlopPx\": " << config.tapSlopPx << ",\n";
    oss << "  \"clickNavigationEnabled\": " << (config.clickNavigationEnabled ? "true" : "false") << ",\n";
    oss << "  \"feedbackNoiseFloor\": " << config.feedbackNoiseFloor << ",\n";
    oss << "  \"showFeedbackOverlay\": " << (config.showFeedbackOverlay ? "true" : "false") << ",\n";
    oss << "  \"showReadingProgressBar\": " << (config.showReadingProgressBar ? "true" : "false") << ",\n";
    oss << "  \"debugLogging\": " << (config.debugLogging ? "true" : "false") << ",\n";
    oss << "  \"fontPath\": \"" << escapeJsonString(config.fontPath) << "\"\n";
    oss << "}\n";
    return oss.str();
}

PageFlipConfig ConfigManager::fromJson(const std::string& json)
{
    PageFlipConfig config;

    readMs(json, "idleGapMs", config.idleGapMs);
    readMs(json, "cooldownMs", config.cooldownMs);
    readMs(json, "feedbackFadeMs", config.feedbackFadeMs);
    readMs(json, "scrollSettleMs", config.scrollSettleMs);
    readFloat(json, "scrollEdgeThresholdPx", config.scrollEdgeThresholdPx);
    readDouble(json, "trackpadDeltaCutoff", config.trackpadDeltaCutoff);
    readDouble(json, "pixelTrackpadDeltaCutoff", config.pixelTrackpadDeltaCutoff);
    readDouble(json, "pixelsPerWheelNotch", config.pixelsPerWheelNotch);
    readDouble(json, "trackpadMultiplier", config.trackpad.multiplier);
    readDouble(json, "trackpadCap", config.trackpad.perEventCap);
    readDouble(json, "trackpadThreshold", config.trackpad.threshold);
    readDouble(json, "wheelMultiplier", config.wheel.multiplier);
    readDouble(json, "wheelCap", config.wheel.perEventCap);
    readDouble(json, "wheelThreshold", config.wheel.threshold);
    readFloat(json, "swipeThresholdPx", config.swipeThresholdPx);
    readMs(json, "swipeMaxDurationMs", config.swipeMaxDurationMs);
    readFloat(json, "tapSlopPx", config.tapSlopPx);
    readBool(json, "clickNavigationEnabled", config.clickNavigationEnabled);
    readFloat(json, "feedbackNoiseFloor", config.feedbackNoiseFloor);
    readBool(json, "showFeedbackOverlay", config.showFeedbackOverlay);
    readBool(json, "showReadingProgressBar", config.showReadingProgressBar);
    readBool(json, "debugLogging", config.debugLogging);
    if (auto fontPath = findStringValue(json, "fontPath"))
    {
        config.fontPath = *fontPath;
    }

    sanitize(config);
    return config;
}

bool ConfigManager::sanitize(PageFlipConfig& config)
{
    const PageFlipConfig defaults;
    bool changed = false;

    changed |= sanitizeProfile(config.trackpad, defaults.trackpad, "Trackpad");
    changed |= sanitizeProfile(config.wheel, defaults.wheel, "Wheel");
    changed |= clampAtLeast(config.trackpadDeltaCutoff, 0.0, "trackpadDeltaCutoff");
    changed |= clampAtLeast(config.pixelTrackpadDeltaCutoff, 0.0, "pixelTrackpadDeltaCutoff");

    if (config.pixelsPerWheelNotch <= 0.0)
    {
        std::cerr << "ConfigManager: pixelsPerWheelNotch must be positive, using " << defaults.pixelsPerWheelNotch << std::endl;
        config.pixelsPerWheelNotch = defaults.pixelsPerWheelNotch;
        changed = true;
    }
    if (config.swipeThresholdPx <= 0.0f)
    {
        std::cerr << "ConfigManager: swipeThresholdPx must be positive, using " << defaults.swipeThresholdPx << std::endl;
        config.swipeThresholdPx = defaults.swipeThresholdPx;
        changed = true;
    }
    if (config.tapSlopPx < 0.0f)
    {
        std::cerr << "ConfigManager: tapSlopPx must not be negative, using " << defaults.tapSlopPx << std::endl;
        config.tapSlopPx = defaults.tapSlopPx;
        changed = true;
    }
    if (config.scrollEdgeThresholdPx < 0.0f)
    {
        std::cerr << "ConfigManager: scrollEdgeThresholdPx must not be negative, using " << defaults.scrollEdgeThresholdPx << std::endl;
        config.scrollEdgeThresholdPx = defaults.scrollEdgeThresholdPx;
        changed = true;
    }
    if (config.feedbackNoiseFloor < 0.0f || config.feedbackNoiseFloor >= 100.0f)
    {
        std::cerr << "ConfigManager: feedbackNoiseFloor must be in [0, 100), using " << defaults.feedbackNoiseFloor << std::endl;
        config.feedbackNoiseFloor = defaults.feedbackNoiseFloor;
        changed = true;
    }

    return changed;
}

bool ConfigManager::saveConfig(const PageFlipConfig& config, std::string configPath) const
{
    if (configPath.empty())
    {
        configPath = getDefaultConfigPath().string();
    }

    try
    {
        std::filesystem::path path(configPath);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(configPath);
        if (!file.is_open())
        {
            std::cerr << "ConfigManager: Failed to open config file for writing: " << configPath << std::endl;
            return false;
        }

        file << toJson(config);
        if (!file)
        {
            std::cerr << "ConfigManager: Failed to write config file: " << configPath << std::endl;
            return false;
        }

        std::cout << "ConfigManager: Configuration saved to: " << configPath << std::endl;
        return true;
    }
    catch (const std::exception& e)
    {
        std::cerr << "ConfigManager: Error saving config: " << e.what() << std::endl;
        return false;
    }
}

PageFlipConfig ConfigManager::loadConfig(std::string configPath) const
{
    PageFlipConfig defaultConfig;

    if (configPath.empty())
    {
        configPath = getDefaultConfigPath().string();
    }

    try
    {
        if (!std::filesystem::exists(configPath))
        {
            std::cout << "ConfigManager: Config file not found, using defaults: " << configPath << std::endl;
            return defaultConfig;
        }

        std::ifstream file(configPath);
        if (!file.is_open())
        {
            std::cerr << "ConfigManager: Failed to open config file: " << configPath << std::endl;
            return defaultConfig;
        }

        std::string json((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());

        PageFlipConfig config = fromJson(json);

        if (!config.fontPath.empty() && !std::filesystem::exists(config.fontPath))
        {
            std::cout << "ConfigManager: Configured font file no longer exists: " << config.fontPath << std::endl;
            config.fontPath.clear();
        }

        std::cout << "ConfigManager: Configuration loaded from: " << configPath << std::endl;
        return config;
    }
    catch (const std::exception& e)
    {
        std::cerr << "ConfigManager: Error loading config: " << e.what() << std::endl;
        return defaultConfig;
    }
}
