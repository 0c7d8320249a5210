// tests/test_Logger.cpp
#include <gtest/gtest.h>
#include "core/Logger.hpp"

namespace ironwatch {
namespace testing {

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::instance().setLogLevel(LogLevel::Info);
    }
};

TEST_F(LoggerTest, ParsesConfigLevelNames) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

TEST_F(LoggerTest, RecentLogsKeepSourceAndLevel) {
    Logger::instance().setLogLevel(LogLevel::Debug);
    LOG_WARNING("logger test entry");

    auto recent = Logger::instance().getRecentLogs(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_NE(recent[0].find("[WARNING]"), std::string::npos);
    EXPECT_NE(recent[0].find("test_Logger.cpp"), std::string::npos);
    EXPECT_NE(recent[0].find("logger test entry"), std::string::npos);
}

TEST_F(LoggerTest, MessagesBelowLevelAreDropped) {
    Logger::instance().setLogLevel(LogLevel::Error);
    LOG_INFO("should not appear");

    auto recent = Logger::instance().getRecentLogs(1);
    if (!recent.empty()) {
        EXPECT_EQ(recent[0].find("should not appear"), std::string::npos);
    }
}

TEST_F(LoggerTest, LogAddedSignalCarriesMessage) {
    std::string received;
    auto connection = QObject::connect(&Logger::instance(), &Logger::logAdded,
        [&received](LogLevel, const std::string& message) { received = message; });

    LOG_ERROR("signalled entry");
    QObject::disconnect(connection);

    EXPECT_EQ(received, "signalled entry");
}

} // namespace testing
} // namespace ironwatch
