#include "routing/SessionAffinity.hpp"

#include "cache/InMemorySharedCache.hpp"
#include "support/TestSupport.hpp"

#include <gtest/gtest.h>

namespace {

using namespace std::chrono_literals;
using llmgate::routing::SessionAffinity;

class SessionAffinityTest : public ::testing::Test {
   protected:
    SessionAffinityTest() : cache_(clock_.function()), affinity_(cache_) {}

    llmgate::testing::ManualClock clock_;
    llmgate::cache::InMemorySharedCache cache_;
    SessionAffinity affinity_;
};

}  // namespace

TEST(SessionAffinitySimilarityTest, JaccardOverLowercaseTokens) {
    EXPECT_DOUBLE_EQ(SessionAffinity::similarity("Fix the parser", "fix THE parser"), 1.0);
    EXPECT_DOUBLE_EQ(SessionAffinity::similarity("a b c d", "a b x y"), 2.0 / 6.0);
    EXPECT_DOUBLE_EQ(SessionAffinity::similarity("alpha beta", "gamma delta"), 0.0);
    EXPECT_DOUBLE_EQ(SessionAffinity::similarity("", "anything"), 0.0);
    EXPECT_DOUBLE_EQ(SessionAffinity::similarity("   ", "  "), 0.0);
}

TEST_F(SessionAffinityTest, FirstPromptHasNoAffinityButIsRemembered) {
    auto decision = affinity_.observe("s1", "explain the lexer", 0.7, 3600s);
    EXPECT_DOUBLE_EQ(decision.similarity, 0.0);
    EXPECT_FALSE(decision.pinnedBackend.has_value());
    EXPECT_EQ(cache_.get(SessionAffinity::promptKey("s1")), "explain the lexer");
}

TEST_F(SessionAffinityTest, CorrelatedPromptReturnsPinnedBackend) {
    affinity_.observe("s1", "explain the lexer state machine", 0.5, 3600s);
    affinity_.pin("s1", "Claude", 3600s);

    auto decision = affinity_.observe("s1", "explain the lexer state machine again", 0.5, 3600s);
    EXPECT_GT(decision.similarity, 0.5);
    EXPECT_EQ(decision.pinnedBackend, "Claude");
}

TEST_F(SessionAffinityTest, SimilarityMustExceedThreshold) {
    affinity_.observe("s1", "a b", 0.5, 3600s);
    affinity_.pin("s1", "Claude", 3600s);

    // {a b} vs {a c}: 1/3. {a c} vs {a c d e}: exactly 0.5.
    EXPECT_FALSE(affinity_.observe("s1", "a c", 0.5, 3600s).pinnedBackend.has_value());
    auto atThreshold = affinity_.observe("s1", "a c d e", 0.5, 3600s);
    EXPECT_DOUBLE_EQ(atThreshold.similarity, 0.5);
    EXPECT_FALSE(atThreshold.pinnedBackend.has_value());
}

TEST_F(SessionAffinityTest, UncorrelatedPromptStillReplacesLastPrompt) {
    affinity_.observe("s1", "explain the lexer", 0.7, 3600s);
    affinity_.observe("s1", "write a haiku about autumn", 0.7, 3600s);
    EXPECT_EQ(cache_.get(SessionAffinity::promptKey("s1")), "write a haiku about autumn");
}

TEST_F(SessionAffinityTest, ReleaseAndExpiryDropThePin) {
    affinity_.observe("s1", "same words here", 0.5, 60s);
    affinity_.pin("s1", "Grok", 60s);
    ASSERT_EQ(affinity_.observe("s1", "same words here", 0.5, 60s).pinnedBackend, "Grok");

    affinity_.release("s1");
    EXPECT_FALSE(affinity_.observe("s1", "same words here", 0.5, 60s).pinnedBackend.has_value());

    affinity_.pin("s1", "Grok", 60s);
    clock_.advance(60s);
    auto expired = affinity_.observe("s1", "same words here", 0.5, 60s);
    EXPECT_DOUBLE_EQ(expired.similarity, 0.0);
    EXPECT_FALSE(expired.pinnedBackend.has_value());
}

TEST_F(SessionAffinityTest, EmptySessionIsIgnored) {
    affinity_.pin("", "Grok", 60s);
    EXPECT_FALSE(affinity_.observe("", "anything", 0.0, 60s).pinnedBackend.has_value());
    EXPECT_FALSE(cache_.get(SessionAffinity::promptKey("")).has_value());
}

TEST_F(SessionAffinityTest, SessionsAreIsolated) {
    affinity_.observe("s1", "shared prompt text", 0.5, 60s);
    affinity_.pin("s1", "Claude", 60s);
    affinity_.observe("s2", "shared prompt text", 0.5, 60s);

    EXPECT_FALSE(affinity_.observe("s2", "shared prompt text", 0.5, 60s).pinnedBackend.has_value());
}
