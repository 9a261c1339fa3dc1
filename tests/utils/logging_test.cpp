#include <gtest/gtest.h>
#include "utils/logging.hpp"

// Restores the process-wide level after each test
class LoggingTest : public ::testing::Test
{
protected:
    logging::LogLevel saved;

    void SetUp() override
    {
        saved = logging::settings().level;
    }

    void TearDown() override
    {
        logging::setLogLevel(saved);
    }
};

TEST_F(LoggingTest, ParsesLevelNames)
{
    logging::LogLevel level = logging::LogLevel::ERROR;
    EXPECT_TRUE(logging::parseLogLevel("debug", level));
    EXPECT_EQ(level, logging::LogLevel::DEBUG);
    EXPECT_TRUE(logging::parseLogLevel("WARN", level));
    EXPECT_EQ(level, logging::LogLevel::WARNING);
    EXPECT_TRUE(logging::parseLogLevel("Info", level));
    EXPECT_EQ(level, logging::LogLevel::INFO);

    EXPECT_FALSE(logging::parseLogLevel("verbose", level));
    EXPECT_EQ(level, logging::LogLevel::INFO);
}

TEST_F(LoggingTest, LevelIsShared)
{
    logging::setLogLevel(logging::LogLevel::DEBUG);
    EXPECT_EQ(logging::settings().level, logging::LogLevel::DEBUG);
    logging::setLogLevel(logging::LogLevel::ERROR);
    EXPECT_EQ(logging::settings().level, logging::LogLevel::ERROR);
}

TEST_F(LoggingTest, ModuleNameFromSignature)
{
    EXPECT_EQ(logging::extractModuleName("DetectionList nms_processing::suppress(const DetectionList&, const NmsParams&)"),
              "NMS_PROCESSING");
    EXPECT_EQ(logging::extractModuleName("bool ModelDetector::initialize()"), "MODELDETECTOR");
    EXPECT_EQ(logging::extractModuleName("int main(int, char**)"), "SYSTEM");
    EXPECT_EQ(logging::extractModuleName("void logging::log(const string&)"), "SYSTEM");
}

TEST_F(LoggingTest, StripsColorCodes)
{
    EXPECT_EQ(logging::stripColorCodes("value \033[36m42\033[0m ok"), "value 42 ok");
    EXPECT_EQ(logging::stripColorCodes("plain"), "plain");
    EXPECT_EQ(logging::stripColorCodes("broken \033[36"), "broken \033[36");
}

TEST_F(LoggingTest, LevelNames)
{
    EXPECT_EQ(logging::logLevelToString(logging::LogLevel::WARNING), "WARN");
    EXPECT_EQ(logging::logLevelToString(logging::LogLevel::DEBUG), "DEBUG");
}

TEST_F(LoggingTest, FileLinesAreUncolored)
{
    string line = logging::formatFileLine("found " + log_string(3), logging::LogLevel::INFO, "MONITOR", "12:00:00.000");
    EXPECT_EQ(line, "[12:00:00.000][INFO][MONITOR] - found 3");
}

TEST_F(LoggingTest, ConsoleLineCarriesLevelAndModule)
{
    string line = logging::stripColorCodes(
        logging::formatConsoleLine("ready", logging::LogLevel::WARNING, "FACTORY", "08:15:00.123", true));
    EXPECT_EQ(line, "[08:15:00.123][WARN][FACTORY] - ready");

    line = logging::stripColorCodes(
        logging::formatConsoleLine("ready", logging::LogLevel::ERROR, "FACTORY", "08:15:00.123", false));
    EXPECT_EQ(line, "[ERROR][FACTORY] - ready");
}
