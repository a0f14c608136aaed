// YIELDGOV - Util Module Tests
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <gtest/gtest.h>

#include <yieldgov/util/logging.h>
#include <yieldgov/util/reentrancy.h>
#include <yieldgov/util/time.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace yieldgov {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("Info"), LogLevel::Info);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info);
}

TEST_F(LoggingTest, AddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = std::make_shared<ConsoleSink>();
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LevelGate) {
    auto& logger = Logger::Instance();
    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::GOVERNANCE));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::GOVERNANCE));

    logger.SetLevel(LogLevel::Error);
    EXPECT_FALSE(logger.WillLog(LogLevel::Warn, LogCategory::GOVERNANCE));
    EXPECT_FALSE(logger.WillLog(LogLevel::Off, LogCategory::GOVERNANCE));
}

TEST_F(LoggingTest, CategoryFiltering) {
    auto& logger = Logger::Instance();
    logger.EnableCategory(LogCategory::LEDGER);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::LEDGER));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::KYC));

    logger.DisableCategory(LogCategory::LEDGER);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::LEDGER));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::KYC));
}

TEST_F(LoggingTest, StreamMacroReachesCallbackSink) {
    std::vector<LogEntry> captured;
    Logger::Instance().AddSink(std::make_shared<CallbackSink>(
        [&](const LogEntry& entry) { captured.push_back(entry); }));

    LOG_INFO(LogCategory::GOVERNANCE) << "ProposalCreated id=" << 7;
    LOG_DEBUG(LogCategory::GOVERNANCE) << "filtered out";
    LogWarnF(LogCategory::DISTRIBUTION, "aborted after %d payments", 3);

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0].message, "ProposalCreated id=7");
    EXPECT_EQ(captured[0].category, LogCategory::GOVERNANCE);
    EXPECT_EQ(captured[0].level, LogLevel::Info);
    EXPECT_EQ(captured[1].message, "aborted after 3 payments");
    EXPECT_EQ(captured[1].level, LogLevel::Warn);
}

TEST_F(LoggingTest, FileSinkAppends) {
    std::string path = "/tmp/yieldgov_logging_test.log";
    std::remove(path.c_str());
    {
        auto sink = std::make_shared<FileSink>(path, LogLevel::Info);
        ASSERT_TRUE(sink->IsOpen());
        Logger::Instance().AddSink(sink);
        LOG_WARN(LogCategory::RESTRICTION) << "TransferBlocked";
        Logger::Instance().Flush();
        Logger::Instance().ClearSinks();
    }

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("[WARN]"), std::string::npos);
    EXPECT_NE(line.find("[restriction]"), std::string::npos);
    EXPECT_NE(line.find("TransferBlocked"), std::string::npos);
    std::remove(path.c_str());
}

TEST_F(LoggingTest, Basename) {
    EXPECT_EQ(GetBasename("/src/governance/governance.cpp"), "governance.cpp");
    EXPECT_EQ(GetBasename("plain.cpp"), "plain.cpp");
}

// ============================================================================
// Time Tests
// ============================================================================

class TimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        DisableMockTime();
    }

    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(TimeTest, WallClock) {
    EXPECT_GT(GetTime(), 1700000000);
}

TEST_F(TimeTest, MockTime) {
    EXPECT_FALSE(IsMockTimeEnabled());

    EnableMockTime();
    EXPECT_TRUE(IsMockTimeEnabled());

    SetMockTime(1000);
    EXPECT_EQ(GetTime(), 1000);

    AdvanceMockTime(86400);
    EXPECT_EQ(GetTime(), 87400);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTime(), 87400);
}

TEST_F(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(45), "45s");
    EXPECT_EQ(FormatDuration(3600), "1h 0m 0s");
    EXPECT_EQ(FormatDuration(7 * 86400), "7d 0h 0m 0s");
    EXPECT_EQ(FormatDuration(-90), "-1m 30s");
}

// ============================================================================
// Reentrancy Guard Tests
// ============================================================================

TEST(ReentrancyTest, NestedScopeIsRejected) {
    ReentrancyGuard guard;
    EXPECT_FALSE(guard.IsEntered());
    {
        ReentrancyScope outer(guard);
        EXPECT_TRUE(outer.Acquired());
        EXPECT_TRUE(guard.IsEntered());

        ReentrancyScope inner(guard);
        EXPECT_FALSE(inner.Acquired());
    }
    EXPECT_FALSE(guard.IsEntered());

    ReentrancyScope again(guard);
    EXPECT_TRUE(again.Acquired());
}

} // namespace
} // namespace util
} // namespace yieldgov
