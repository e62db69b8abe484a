// File: tests/test_log.cpp
// Purpose: Verify log line formatting, level filtering and level parsing.
// Key invariants: Messages below the threshold never reach the sink; every
//                 line carries the level tag and a HH:MM:SS stamp.
// Ownership/Lifetime: Each test installs a local string sink and restores the
//                     default sink and level on exit.

#include "keydeck/log/log.hpp"

#include <gtest/gtest.h>

#include <regex>
#include <sstream>

namespace keydeck::log
{
namespace
{

class LogTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        setSink(&out_);
        setLevel(Level::Info);
    }

    void TearDown() override
    {
        setSink(nullptr);
        setLevel(Level::Info);
    }

    std::ostringstream out_;
};

TEST_F(LogTest, FormatsLevelTimestampAndMessage)
{
    info("hello deck");
    const std::regex line(R"(\[INFO\] \d\d:\d\d:\d\d hello deck\n)");
    EXPECT_TRUE(std::regex_match(out_.str(), line)) << out_.str();
}

TEST_F(LogTest, DropsMessagesBelowThreshold)
{
    debug("hidden");
    EXPECT_TRUE(out_.str().empty());

    setLevel(Level::Debug);
    debug("shown");
    EXPECT_NE(out_.str().find("[DEBUG] "), std::string::npos);
}

TEST_F(LogTest, WarnAndErrorPassAtWarnLevel)
{
    setLevel(Level::Warn);
    info("quiet");
    warn("careful");
    error("broken");
    const std::string text = out_.str();
    EXPECT_EQ(text.find("quiet"), std::string::npos);
    EXPECT_NE(text.find("[WARN] "), std::string::npos);
    EXPECT_NE(text.find("[ERROR] "), std::string::npos);
}

TEST_F(LogTest, OffSilencesEverything)
{
    setLevel(Level::Off);
    error("nobody hears");
    EXPECT_TRUE(out_.str().empty());
    EXPECT_FALSE(enabled(Level::Error));
    EXPECT_FALSE(enabled(Level::Off));
}

TEST_F(LogTest, EnabledFollowsThreshold)
{
    setLevel(Level::Warn);
    EXPECT_FALSE(enabled(Level::Info));
    EXPECT_TRUE(enabled(Level::Warn));
    EXPECT_TRUE(enabled(Level::Error));
    EXPECT_EQ(level(), Level::Warn);
}

TEST(LogLevelParse, AcceptsNamesCaseInsensitively)
{
    EXPECT_EQ(parseLevel("debug"), Level::Debug);
    EXPECT_EQ(parseLevel("INFO"), Level::Info);
    EXPECT_EQ(parseLevel("Warn"), Level::Warn);
    EXPECT_EQ(parseLevel("warning"), Level::Warn);
    EXPECT_EQ(parseLevel("error"), Level::Error);
    EXPECT_EQ(parseLevel("off"), Level::Off);
    EXPECT_FALSE(parseLevel("bogus").has_value());
    EXPECT_FALSE(parseLevel("").has_value());
}

TEST(LogLevelParse, NamesRoundTripThroughParse)
{
    for (Level l : {Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Off})
    {
        EXPECT_EQ(parseLevel(levelName(l)), l);
    }
}

} // namespace
} // namespace keydeck::log
