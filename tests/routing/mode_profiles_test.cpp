#include "routing/ModeProfiles.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace {

using namespace llmgate::routing;

}  // namespace

TEST(ModeProfilesTest, DefaultsFollowModeIntent) {
    const auto profiles = ModeProfiles::defaults();

    auto autoSimple = profiles.weights(RoutingMode::Auto, TaskComplexity::Simple);
    EXPECT_DOUBLE_EQ(autoSimple.at("DeepSeek"), 80.0);
    EXPECT_DOUBLE_EQ(autoSimple.at("GPT-4"), 2.0);

    auto autoComplex = profiles.weights(RoutingMode::Auto, TaskComplexity::Complex);
    EXPECT_DOUBLE_EQ(autoComplex.at("Claude"), 50.0);

    auto autoMultimodal = profiles.weights(RoutingMode::Auto, TaskComplexity::Multimodal);
    EXPECT_DOUBLE_EQ(autoMultimodal.at("Gemini"), 70.0);

    for (auto complexity : {TaskComplexity::Simple, TaskComplexity::Complex, TaskComplexity::Multimodal}) {
        EXPECT_DOUBLE_EQ(profiles.weights(RoutingMode::Performance, complexity).at("Claude"), 60.0);
        EXPECT_DOUBLE_EQ(profiles.weights(RoutingMode::Efficient, complexity).at("DeepSeek"), 90.0);
        EXPECT_DOUBLE_EQ(profiles.weights(RoutingMode::Lite, complexity).at("Grok"), 70.0);
        EXPECT_DOUBLE_EQ(profiles.weights(RoutingMode::Lite, complexity).at("Claude"), 0.0);
    }

    auto efficientReasoning = profiles.weights(RoutingMode::Efficient, TaskComplexity::Reasoning);
    EXPECT_DOUBLE_EQ(efficientReasoning.at("DeepSeek"), 60.0);
    EXPECT_DOUBLE_EQ(efficientReasoning.at("Grok"), 35.0);
}

TEST(ModeProfilesTest, LoadOverlaysConfiguredTables) {
    const auto profiles = ModeProfiles::load(YAML::Load(R"(
lite:
  all:
    Grok: 50
    Llama: 50
  reasoning:
    Llama: 100
performance:
  complex:
    GPT-4: 90
)"));

    auto liteSimple = profiles.weights(RoutingMode::Lite, TaskComplexity::Simple);
    EXPECT_DOUBLE_EQ(liteSimple.at("Llama"), 50.0);
    EXPECT_EQ(liteSimple.count("DeepSeek"), 0U);

    auto liteReasoning = profiles.weights(RoutingMode::Lite, TaskComplexity::Reasoning);
    EXPECT_EQ(liteReasoning.size(), 1U);
    EXPECT_DOUBLE_EQ(liteReasoning.at("Llama"), 100.0);

    EXPECT_EQ(profiles.weights(RoutingMode::Performance, TaskComplexity::Complex).size(), 1U);
    EXPECT_DOUBLE_EQ(profiles.weights(RoutingMode::Performance, TaskComplexity::Simple).at("Claude"), 60.0);
    EXPECT_DOUBLE_EQ(profiles.weights(RoutingMode::Auto, TaskComplexity::Simple).at("DeepSeek"), 80.0);
}

TEST(ModeProfilesTest, LoadRejectsUnknownNamesAndNegativeWeights) {
    EXPECT_THROW(ModeProfiles::load(YAML::Load("turbo:\n  all:\n    Grok: 1\n")), std::invalid_argument);
    EXPECT_THROW(ModeProfiles::load(YAML::Load("lite:\n  trivial:\n    Grok: 1\n")), std::invalid_argument);
    EXPECT_THROW(ModeProfiles::load(YAML::Load("lite:\n  all:\n    Grok: -1\n")), std::invalid_argument);
    EXPECT_THROW(ModeProfiles::load(YAML::Load("- lite\n")), std::invalid_argument);
    EXPECT_NO_THROW(ModeProfiles::load(YAML::Node()));
}

TEST(ModeProfilesTest, ParseRoutingModeIsCaseInsensitive) {
    EXPECT_EQ(parseRoutingMode("Efficient"), RoutingMode::Efficient);
    EXPECT_EQ(parseRoutingMode("AUTO"), RoutingMode::Auto);
    EXPECT_FALSE(parseRoutingMode("fastest").has_value());
    EXPECT_FALSE(parseRoutingMode("").has_value());
    EXPECT_EQ(toString(RoutingMode::Performance), "performance");
}

TEST(ModeProfilesTest, OverrideCostWeightsOnlyTouchesPlanBackends) {
    const std::map<std::string, double> plan{{"DeepSeek", 10.0}, {"Claude", 40.0}, {"Llama", 25.0}};
    const ModeWeights mode{{"DeepSeek", 90.0}, {"Claude", 0.0}, {"GPT-4", 100.0}};

    const auto merged = overrideCostWeights(plan, mode);
    EXPECT_EQ(merged.size(), 3U);
    EXPECT_DOUBLE_EQ(merged.at("DeepSeek"), 90.0);
    EXPECT_DOUBLE_EQ(merged.at("Claude"), 0.0);
    EXPECT_DOUBLE_EQ(merged.at("Llama"), 25.0);
    EXPECT_EQ(merged.count("GPT-4"), 0U);
}
