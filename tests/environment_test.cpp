#include "llmgate/environment.h"

#include "support/TestSupport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace {

using llmgate::testing::ScopedEnvVar;

class EnvironmentTest : public ::testing::Test {};

}  // namespace

TEST_F(EnvironmentTest, LoadDotEnvPopulatesEnvironment) {
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = std::filesystem::temp_directory_path() / ("llmgate-test-" + std::to_string(timestamp) + ".env");

    {
        std::ofstream output(path);
        ASSERT_TRUE(output.is_open());
        output << "# comment\n";
        output << "TEST_KEY = test_value\n";
        output << "QUOTED='quoted value'\n";
        output << "EMPTY=\n";
    }

    ScopedEnvVar testKeyGuard("TEST_KEY");
    ScopedEnvVar quotedGuard("QUOTED");
    ScopedEnvVar emptyGuard("EMPTY");
    testKeyGuard.clear();
    quotedGuard.clear();
    emptyGuard.clear();

    ASSERT_TRUE(llmgate::loadDotEnv(path));

    auto testValue = llmgate::getEnv("TEST_KEY");
    ASSERT_TRUE(testValue.has_value());
    EXPECT_EQ(*testValue, "test_value");

    auto quotedValue = llmgate::getEnv("QUOTED");
    ASSERT_TRUE(quotedValue.has_value());
    EXPECT_EQ(*quotedValue, "quoted value");

    auto emptyValue = llmgate::getEnv("EMPTY");
    ASSERT_TRUE(emptyValue.has_value());
    EXPECT_TRUE(emptyValue->empty());

    std::filesystem::remove(path);
}

TEST_F(EnvironmentTest, LoadDotEnvReportsMissingFile) {
    EXPECT_FALSE(llmgate::loadDotEnv(std::filesystem::temp_directory_path() / "llmgate-does-not-exist.env"));
}

TEST_F(EnvironmentTest, GetEnvOrDefaultReturnsFallbackWhenUnset) {
    ScopedEnvVar guard("MISSING_KEY");
    guard.clear();

    EXPECT_EQ(llmgate::getEnvOrDefault("MISSING_KEY", "default"), "default");

    guard.set("configured");
    EXPECT_EQ(llmgate::getEnvOrDefault("MISSING_KEY", "default"), "configured");
}

TEST_F(EnvironmentTest, GetEnvFlagParsesCommonValues) {
    ScopedEnvVar guard("FLAG_KEY");

    guard.set("true");
    EXPECT_TRUE(llmgate::getEnvFlag("FLAG_KEY", false));

    guard.set("off");
    EXPECT_FALSE(llmgate::getEnvFlag("FLAG_KEY", true));

    guard.set("unexpected");
    EXPECT_TRUE(llmgate::getEnvFlag("FLAG_KEY", true));

    guard.clear();
    EXPECT_FALSE(llmgate::getEnvFlag("FLAG_KEY", false));
}

TEST_F(EnvironmentTest, GetEnvDoubleRejectsTrailingGarbage) {
    ScopedEnvVar guard("WEIGHT_TEST");

    guard.set("2.5");
    EXPECT_DOUBLE_EQ(llmgate::getEnvDouble("WEIGHT_TEST", 1.0), 2.5);

    guard.set("2.5x");
    EXPECT_DOUBLE_EQ(llmgate::getEnvDouble("WEIGHT_TEST", 1.0), 1.0);

    guard.clear();
    EXPECT_DOUBLE_EQ(llmgate::getEnvDouble("WEIGHT_TEST", 1.0), 1.0);
}

TEST_F(EnvironmentTest, ExpandEnvPlaceholderUsesVariableThenFallback) {
    ScopedEnvVar guard("LLMGATE_PLACEHOLDER");
    guard.clear();

    EXPECT_EQ(llmgate::expandEnvPlaceholder("${LLMGATE_PLACEHOLDER:-logs/usage.jsonl}"), "logs/usage.jsonl");
    EXPECT_EQ(llmgate::expandEnvPlaceholder("${LLMGATE_PLACEHOLDER}"), "");

    guard.set("/var/log/llmgate/usage.jsonl");
    EXPECT_EQ(llmgate::expandEnvPlaceholder("${LLMGATE_PLACEHOLDER:-logs/usage.jsonl}"), "/var/log/llmgate/usage.jsonl");

    EXPECT_EQ(llmgate::expandEnvPlaceholder("plain text"), "plain text");
    EXPECT_EQ(llmgate::expandEnvPlaceholder("prefix ${LLMGATE_PLACEHOLDER}"), "prefix ${LLMGATE_PLACEHOLDER}");
}
