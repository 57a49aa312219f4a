// Pasifika - Logging Tests
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include <gtest/gtest.h>

#include "pasifika/util/logging.h"

#include <memory>
#include <vector>

namespace pasifika {
namespace util {
namespace test {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Info);
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); }, LogLevel::Trace);
        logger.AddSink(sink_);
    }

    void TearDown() override {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, LevelNames) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("nonsense"), LogLevel::Info);
}

TEST_F(LoggingTest, StreamMacroDeliversEntry) {
    LOG_INFO(LogCategory::TREASURY) << "Deposit " << 42;
    ASSERT_EQ(entries_.size(), 1);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, LogCategory::TREASURY);
    EXPECT_EQ(entries_[0].message, "Deposit 42");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, BelowGlobalLevelIsDropped) {
    LOG_DEBUG(LogCategory::FEES) << "hidden";
    EXPECT_TRUE(entries_.empty());

    Logger::Instance().SetLevel(LogLevel::Debug);
    LOG_DEBUG(LogCategory::FEES) << "shown";
    EXPECT_EQ(entries_.size(), 1);
}

TEST_F(LoggingTest, CategoryFilter) {
    auto& logger = Logger::Instance();
    logger.EnableCategory(LogCategory::STAKING);

    LOG_INFO(LogCategory::STAKING) << "kept";
    LOG_INFO(LogCategory::TRANSFER) << "filtered";
    ASSERT_EQ(entries_.size(), 1);
    EXPECT_EQ(entries_[0].message, "kept");
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::TRANSFER));
}

TEST_F(LoggingTest, SinkLevelFilter) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::LEDGER) << "warn";
    LOG_ERROR(LogCategory::LEDGER) << "error";
    ASSERT_EQ(entries_.size(), 1);
    EXPECT_EQ(entries_[0].level, LogLevel::Error);
}

TEST_F(LoggingTest, RemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 1);
    logger.RemoveSink(sink_);
    EXPECT_EQ(logger.SinkCount(), 0);
    LOG_INFO(LogCategory::DEFAULT) << "nowhere";
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, Helpers) {
    EXPECT_EQ(FixedWidth("abc", 5), "abc  ");
    EXPECT_EQ(FixedWidth("abcdef", 3), "abc");
    EXPECT_EQ(GetBasename("/src/fees/fee_engine.cpp"), "fee_engine.cpp");
}

} // namespace test
} // namespace util
} // namespace pasifika
