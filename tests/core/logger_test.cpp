#include <gtest/gtest.h>
#include <peerlink/core/logger.hpp>

#include <string>
#include <utility>
#include <vector>

namespace peerlink::core::test {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = Logger::getLevel();
        Logger::setLevel(LogLevel::DEBUG);
        Logger::setSink([this](LogLevel level, const std::string& message) {
            messages_.emplace_back(level, message);
        });
    }

    void TearDown() override {
        Logger::resetSink();
        Logger::setLevel(previous_);
    }

    LogLevel previous_ = LogLevel::INFO;
    std::vector<std::pair<LogLevel, std::string>> messages_;
};

TEST_F(LoggerTest, BasicLogging) {
    Logger::info("Test message");
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0].first, LogLevel::INFO);
    EXPECT_EQ(messages_[0].second, "Test message");
}

TEST_F(LoggerTest, FormatsPlaceholdersInOrder) {
    Logger::warn("{} close timeout after {} polls", "session engine", 10);
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0].second, "session engine close timeout after 10 polls");
}

TEST_F(LoggerTest, ExtraArgumentsAreDropped) {
    Logger::debug("only {}", "one", "two");
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(messages_[0].second, "only one");
}

TEST_F(LoggerTest, LevelFiltering) {
    Logger::setLevel(LogLevel::WARN);

    Logger::debug("debug");
    Logger::info("info");
    Logger::warn("warn");
    Logger::error("error");

    ASSERT_EQ(messages_.size(), 2u);
    EXPECT_EQ(messages_[0].second, "warn");
    EXPECT_EQ(messages_[1].second, "error");
}

TEST_F(LoggerTest, FormatMessageWithoutSink) {
    EXPECT_EQ(Logger::formatMessage("{}-{}", 1, "a"), "1-a");
    EXPECT_EQ(Logger::formatMessage("no placeholders"), "no placeholders");
    EXPECT_TRUE(messages_.empty());
}

TEST(LogLevelTest, Names) {
    EXPECT_STREQ(toString(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(toString(LogLevel::ERROR), "ERROR");
}

} // namespace peerlink::core::test
