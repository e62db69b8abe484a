// File: tests/test_config.cpp
// Purpose: Load INI fixtures and verify parsed values, defaults and the
//          warnings emitted for rejected entries.
// Key invariants: Invalid values leave the default in place and log one
//                 warning each; unknown keys and sections are ignored.
// Ownership/Lifetime: Fixture files live under KEYDECK_TEST_DATA_DIR.

#include "keydeck/config/config.hpp"
#include "keydeck/log/log.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace keydeck::config
{
namespace
{

using namespace std::chrono_literals;

std::string dataFile(const char *name)
{
    return std::string(KEYDECK_TEST_DATA_DIR) + "/" + name;
}

std::size_t warnings(const std::string &text)
{
    std::size_t n = 0;
    for (auto pos = text.find("[WARN]"); pos != std::string::npos; pos = text.find("[WARN]", pos + 1))
    {
        ++n;
    }
    return n;
}

class ConfigTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        log::setSink(&logs_);
    }

    void TearDown() override
    {
        log::setSink(nullptr);
    }

    std::ostringstream logs_;
};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues)
{
    const Config cfg;
    EXPECT_EQ(cfg.device.index, 0u);
    EXPECT_EQ(cfg.device.brightness, 30);
    EXPECT_EQ(cfg.runtime.longPressDelay, 500ms);
    EXPECT_EQ(cfg.log.level, log::Level::Info);
    EXPECT_EQ(cfg.climate.cacheTtl, 60s);
    EXPECT_EQ(cfg.climate.appliance, "living-ac");
    EXPECT_EQ(cfg.climate.roomSensor, "living-room");
}

TEST_F(ConfigTest, LoadsEveryRecognisedKey)
{
    Config cfg;
    ASSERT_TRUE(loadFromFile(dataFile("keydeck.ini"), cfg));
    EXPECT_EQ(cfg.device.index, 1u);
    EXPECT_EQ(cfg.device.brightness, 70);
    EXPECT_EQ(cfg.runtime.longPressDelay, 800ms);
    EXPECT_EQ(cfg.log.level, log::Level::Debug);
    EXPECT_EQ(cfg.climate.cacheTtl, 30s);
    EXPECT_EQ(cfg.climate.appliance, "bedroom-ac");
    EXPECT_EQ(cfg.climate.roomSensor, "bedroom");
    EXPECT_EQ(warnings(logs_.str()), 0u);
}

TEST_F(ConfigTest, RejectedValuesKeepDefaultsAndWarn)
{
    Config cfg;
    ASSERT_TRUE(loadFromFile(dataFile("bad_values.ini"), cfg));
    EXPECT_EQ(cfg.device.index, 0u);
    EXPECT_EQ(cfg.device.brightness, 30);
    EXPECT_EQ(cfg.runtime.longPressDelay, 500ms);
    EXPECT_EQ(cfg.log.level, log::Level::Info);
    EXPECT_EQ(cfg.climate.cacheTtl, 5s);
    EXPECT_EQ(cfg.climate.appliance, "living-ac");

    const std::string text = logs_.str();
    EXPECT_EQ(warnings(text), 5u);
    EXPECT_NE(text.find("config: ignoring [device] brightness = '150'"), std::string::npos);
    EXPECT_NE(text.find("config: ignoring [log] level = 'loud'"), std::string::npos);
}

TEST_F(ConfigTest, MissingFileLeavesConfigUntouched)
{
    Config cfg;
    cfg.device.brightness = 55;
    EXPECT_FALSE(loadFromFile(dataFile("does-not-exist.ini"), cfg));
    EXPECT_EQ(cfg.device.brightness, 55);
}

} // namespace
} // namespace keydeck::config
