#include <gtest/gtest.h>

#include <string>
#include <vector>
#include <xplorer/logger.hpp>

using namespace xplorer;

namespace
{

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        auto& logger = Logger::instance();
        saved_level_ = logger.get_level();
        logger.clear_sinks();
        logger.add_sink([this](const Logger::LogEntry& e) { entries.push_back(e); });
        logger.set_level(LogLevel::Trace);
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(saved_level_);
    }

    std::vector<Logger::LogEntry> entries;
    LogLevel                      saved_level_ = LogLevel::Info;
};

}   // namespace

TEST_F(LoggerTest, FormatsPlaceholdersInOrder)
{
    XPLORER_LOG_INFO("test", "window {} has {} tabs", 3, std::string("two"));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "window 3 has two tabs");
    EXPECT_EQ(entries[0].category, "test");
    EXPECT_EQ(entries[0].level, LogLevel::Info);
}

TEST_F(LoggerTest, ExtraPlaceholdersStayLiteral)
{
    XPLORER_LOG_DEBUG("test", "{} and {}", "one");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "one and {}");
}

TEST_F(LoggerTest, BoolsAndEnumsFormat)
{
    XPLORER_LOG_INFO("test", "{} {}", true, LogLevel::Error);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "true 4");
}

TEST_F(LoggerTest, LevelFiltersEntries)
{
    Logger::instance().set_level(LogLevel::Warning);
    XPLORER_LOG_INFO("test", "dropped");
    XPLORER_LOG_WARN("test", "kept");
    XPLORER_LOG_CRITICAL("test", "kept too");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "kept");
}

TEST_F(LoggerTest, EverySinkReceivesEntry)
{
    int second = 0;
    Logger::instance().add_sink([&](const Logger::LogEntry&) { ++second; });
    XPLORER_LOG_ERROR("test", "boom");
    EXPECT_EQ(entries.size(), 1u);
    EXPECT_EQ(second, 1);
}

TEST(LoggerLevels, NamesRoundTrip)
{
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                       LogLevel::Error, LogLevel::Critical})
    {
        auto parsed = Logger::level_from_string(Logger::level_to_string(level));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, level);
    }
}

TEST(LoggerLevels, ParsingIsCaseInsensitive)
{
    EXPECT_EQ(Logger::level_from_string("Warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::level_from_string("DEBUG"), LogLevel::Debug);
    EXPECT_FALSE(Logger::level_from_string("verbose").has_value());
}
