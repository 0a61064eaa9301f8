#include "config_manager.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace
{
class ConfigManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        configPath = std::filesystem::temp_directory_path() /
                     ("pageflip_config_test_" +
                      std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".json");
        std::filesystem::remove(configPath);
    }

    void TearDown() override
    {
        std::filesystem::remove(configPath);
    }

    void writeFile(const std::string& contents)
    {
        std::ofstream file(configPath);
        file << contents;
    }

    std::filesystem::path configPath;
    ConfigManager manager;
};
} // namespace

TEST_F(ConfigManagerTest, MissingFileGivesDefaults)
{
    PageFlipConfig config = manager.loadConfig(configPath.string());
    EXPECT_EQ(config.idleGapMs, 200u);
    EXPECT_EQ(config.cooldownMs, 800u);
    EXPECT_DOUBLE_EQ(config.wheel.threshold, 150.0);
    EXPECT_DOUBLE_EQ(config.trackpad.multiplier, 2.5);
    EXPECT_FALSE(config.clickNavigationEnabled);
    EXPECT_EQ(config.scrollSettleMs, 150u);
    EXPECT_FLOAT_EQ(config.scrollEdgeThresholdPx, 5.0f);
}

TEST_F(ConfigManagerTest, SavedConfigLoadsBack)
{
    PageFlipConfig config;
    config.idleGapMs = 250;
    config.cooldownMs = 1000;
    config.wheel = DeviceProfile{1.25, 40.0, 120.0};
    config.trackpad.threshold = 300.0;
    config.swipeThresholdPx = 80.0f;
    config.swipeMaxDurationMs = 400;
    config.clickNavigationEnabled = true;
    config.showReadingProgressBar = false;
    config.scrollSettleMs = 90;
    config.scrollEdgeThresholdPx = 12.0f;

    ASSERT_TRUE(manager.saveConfig(config, configPath.string()));
    PageFlipConfig loaded = manager.loadConfig(configPath.string());

    EXPECT_EQ(loaded.idleGapMs, 250u);
    EXPECT_EQ(loaded.cooldownMs, 1000u);
    EXPECT_DOUBLE_EQ(loaded.wheel.multiplier, 1.25);
    EXPECT_DOUBLE_EQ(loaded.wheel.perEventCap, 40.0);
    EXPECT_DOUBLE_EQ(loaded.wheel.threshold, 120.0);
    EXPECT_DOUBLE_EQ(loaded.trackpad.threshold, 300.0);
    EXPECT_FLOAT_EQ(loaded.swipeThresholdPx, 80.0f);
    EXPECT_EQ(loaded.swipeMaxDurationMs, 400u);
    EXPECT_TRUE(loaded.clickNavigationEnabled);
    EXPECT_FALSE(loaded.showReadingProgressBar);
    EXPECT_EQ(loaded.scrollSettleMs, 90u);
    EXPECT_FLOAT_EQ(loaded.scrollEdgeThresholdPx, 12.0f);
}

TEST_F(ConfigManagerTest, PartialFileKeepsOtherDefaults)
{
    writeFile("{\n  \"cooldownMs\": 600,\n  \"clickNavigationEnabled\": true\n}\n");
    PageFlipConfig config = manager.loadConfig(configPath.string());
    EXPECT_EQ(config.cooldownMs, 600u);
    EXPECT_TRUE(config.clickNavigationEnabled);
    EXPECT_EQ(config.idleGapMs, 200u);
    EXPECT_FLOAT_EQ(config.tapSlopPx, 8.0f);
}

TEST_F(ConfigManagerTest, MalformedValuesFallBack)
{
    writeFile("{ \"idleGapMs\": \"soon\", \"wheelThreshold\": 12abc, \"showFeedbackOverlay\": maybe }");
    PageFlipConfig config = manager.loadConfig(configPath.string());
    EXPECT_EQ(config.idleGapMs, 200u);
    EXPECT_DOUBLE_EQ(config.wheel.threshold, 150.0);
    EXPECT_TRUE(config.showFeedbackOverlay);
}

TEST_F(ConfigManagerTest, InvalidValuesAreSanitized)
{
    PageFlipConfig config;
    config.wheel.threshold = 0.0;
    config.trackpad.multiplier = -1.0;
    config.swipeThresholdPx = -5.0f;
    config.feedbackNoiseFloor = 150.0f;
    config.pixelsPerWheelNotch = 0.0;
    config.scrollEdgeThresholdPx = -1.0f;

    EXPECT_TRUE(ConfigManager::sanitize(config));
    EXPECT_DOUBLE_EQ(config.wheel.threshold, 150.0);
    EXPECT_DOUBLE_EQ(config.trackpad.multiplier, 2.5);
    EXPECT_FLOAT_EQ(config.swipeThresholdPx, 50.0f);
    EXPECT_FLOAT_EQ(config.feedbackNoiseFloor, 5.0f);
    EXPECT_DOUBLE_EQ(config.pixelsPerWheelNotch, 100.0);
    EXPECT_FLOAT_EQ(config.scrollEdgeThresholdPx, 5.0f);

    PageFlipConfig valid;
    EXPECT_FALSE(ConfigManager::sanitize(valid));
}

TEST_F(ConfigManagerTest, NegativeTimingsClampToZero)
{
    PageFlipConfig config = ConfigManager::fromJson("{ \"cooldownMs\": -50 }");
    EXPECT_EQ(config.cooldownMs, 0u);
}

TEST_F(ConfigManagerTest, MissingFontIsDropped)
{
    writeFile("{ \"fontPath\": \"/nonexistent/pageflip/font.ttf\" }");
    PageFlipConfig config = manager.loadConfig(configPath.string());
    EXPECT_TRUE(config.fontPath.empty());
}

TEST_F(ConfigManagerTest, EscapedStringsSurvive)
{
    PageFlipConfig config;
    config.fontPath = "C:\\fonts\\\"odd\".ttf";
    PageFlipConfig parsed = ConfigManager::fromJson(ConfigManager::toJson(config));
    EXPECT_EQ(parsed.fontPath, config.fontPath);
}
