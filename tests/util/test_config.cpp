// YIELDGOV - Configuration File Parser Tests
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <gtest/gtest.h>

#include "yieldgov/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace yieldgov {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/yieldgov_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigTest, ParsesKeysSectionsAndComments) {
    auto result = config_.ParseString(
        "# deployment\n"
        "network = testnet\n"
        "; another comment\n"
        "[governance]\n"
        "quorum_bp = 1500\n"
        "voting_power_mode = \"snapshot\"\n");

    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString("network", ""), "testnet");
    EXPECT_EQ(config_.GetInt("quorum_bp", 0, "governance"), 1500);
    EXPECT_EQ(config_.GetString("voting_power_mode", "", "governance"), "snapshot");
    EXPECT_FALSE(config_.HasKey("quorum_bp"));
    EXPECT_EQ(config_.Size(), 3u);
}

TEST_F(ConfigTest, ReportsSyntaxErrorsWithLine) {
    auto result = config_.ParseString("ok = 1\nnot a pair\n", "inline.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "inline.conf");
    EXPECT_EQ(result.errorLine, 2);

    ConfigManager other;
    EXPECT_FALSE(other.ParseString("[broken\n").success);
}

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[ledger]\nmax_shareholders = 250\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetUInt("max_shareholders", 0, "ledger"), 250u);

    EXPECT_FALSE(config_.ParseFile("/nonexistent/yieldgov.conf").success);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, BooleanForms) {
    config_.ParseString("a = yes\nb = off\nc = TRUE\nd = maybe\n");
    EXPECT_EQ(config_.TryGetBool("a"), true);
    EXPECT_EQ(config_.TryGetBool("b"), false);
    EXPECT_EQ(config_.TryGetBool("c"), true);
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));
}

TEST_F(ConfigTest, UnsignedRejectsNegative) {
    config_.ParseString("n = -5\nm = 12abc\n");
    EXPECT_EQ(config_.TryGetInt("n"), -5);
    EXPECT_FALSE(config_.TryGetUInt("n").has_value());
    EXPECT_FALSE(config_.TryGetInt("m").has_value());
    EXPECT_EQ(config_.GetUInt("missing", 7), 7u);
}

TEST_F(ConfigTest, DurationSuffixes) {
    config_.ParseString("a = 90\nb = 15m\nc = 6h\nd = 7d\ne = 3w\nf = -1d\n");
    EXPECT_EQ(config_.TryGetDuration("a"), 90);
    EXPECT_EQ(config_.TryGetDuration("b"), 15 * 60);
    EXPECT_EQ(config_.TryGetDuration("c"), 6 * 3600);
    EXPECT_EQ(config_.TryGetDuration("d"), 7 * 86400);
    EXPECT_FALSE(config_.TryGetDuration("e").has_value());
    EXPECT_FALSE(config_.TryGetDuration("f").has_value());
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("YIELDGOV_TEST_QUORUM", "2000", 1);
    config_.ParseString("[governance]\nquorum_bp = ${YIELDGOV_TEST_QUORUM}\n");
    EXPECT_EQ(config_.GetInt("quorum_bp", 0, "governance"), 2000);
    unsetenv("YIELDGOV_TEST_QUORUM");

    EXPECT_EQ(ConfigManager::ExpandEnvVars("x${YIELDGOV_UNSET_VAR}y"), "xy");
}

// ============================================================================
// Setting and Validation
// ============================================================================

TEST_F(ConfigTest, SetDefaultDoesNotOverride) {
    config_.Set("threshold_bp", "200", "governance");
    config_.SetDefault("threshold_bp", "100", "governance");
    config_.SetDefault("quorum_bp", "1000", "governance");
    EXPECT_EQ(config_.GetInt("threshold_bp", 0, "governance"), 200);
    EXPECT_EQ(config_.GetInt("quorum_bp", 0, "governance"), 1000);

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0], "governance");
    EXPECT_EQ(config_.GetKeys("governance").size(), 2u);
}

TEST_F(ConfigTest, ValidateRequiredAndUnknownKeys) {
    config_.RequireKey("voting_period", "governance");
    config_.AllowKey("quorum_bp", "governance");
    config_.ParseString("[governance]\nquorum_bp = 1000\ntypo_key = 1\n");

    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 2u);

    config_.Set("voting_period", "7d", "governance");
    EXPECT_EQ(config_.Validate().size(), 1u);
}

} // namespace test
} // namespace util
} // namespace yieldgov
