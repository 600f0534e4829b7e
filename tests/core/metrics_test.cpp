#include "core/Metrics.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

class MetricsRegistryTest : public ::testing::Test {
   protected:
    void SetUp() override { llmgate::core::MetricsRegistry::instance().reset(); }
    void TearDown() override { llmgate::core::MetricsRegistry::instance().reset(); }
};

bool contains(const std::string &text, const std::string &needle) {
    return text.find(needle) != std::string::npos;
}

}  // namespace

TEST_F(MetricsRegistryTest, CompletedObservationIsLabelledWithBackend) {
    auto &registry = llmgate::core::MetricsRegistry::instance();
    auto observation = registry.startRequest("/v1/route", 128, 12);
    observation->setBackend("DeepSeek");
    observation->complete(200, 512, 30);

    const auto text = registry.renderPrometheus();
    EXPECT_TRUE(contains(text, "llmgate_requests_total{backend=\"DeepSeek\",endpoint=\"/v1/route\"} 1"));
    EXPECT_TRUE(contains(text, "llmgate_bytes_in{backend=\"DeepSeek\",endpoint=\"/v1/route\"} 128"));
    EXPECT_TRUE(contains(text, "llmgate_tokens_out{backend=\"DeepSeek\",endpoint=\"/v1/route\"} 30"));
    EXPECT_TRUE(contains(text, "llmgate_latency_ms_count{backend=\"DeepSeek\",endpoint=\"/v1/route\"} 1"));
}

TEST_F(MetricsRegistryTest, ErrorStatusesAreCountedByClass) {
    auto &registry = llmgate::core::MetricsRegistry::instance();
    registry.startRequest("/v1/route", 10)->complete(429, 64, 0);
    registry.startRequest("/v1/route", 10)->complete(503, 64, 0);

    const auto text = registry.renderPrometheus();
    EXPECT_TRUE(contains(text, "llmgate_errors_total{backend=\"none\",endpoint=\"/v1/route\",type=\"http_4xx\"} 1"));
    EXPECT_TRUE(contains(text, "llmgate_errors_total{backend=\"none\",endpoint=\"/v1/route\",type=\"http_5xx\"} 1"));
}

TEST_F(MetricsRegistryTest, CompleteIsIdempotent) {
    auto &registry = llmgate::core::MetricsRegistry::instance();
    auto observation = registry.startRequest("/health", 0);
    observation->complete(200, 10, 0);
    observation->complete(500, 10, 0);

    EXPECT_EQ(observation->statusCode(), 200U);
    EXPECT_TRUE(contains(registry.renderPrometheus(), "llmgate_requests_total{backend=\"none\",endpoint=\"/health\"} 1"));
}

TEST_F(MetricsRegistryTest, RoutingCountersAccumulate) {
    auto &registry = llmgate::core::MetricsRegistry::instance();
    registry.recordRouteOutcome("ok", false, 1);
    registry.recordRouteOutcome("ok", true, 2);
    registry.recordRouteOutcome("rate_limited", false, 0);
    registry.incrementAdmissionRejection("rate_limited");

    const auto text = registry.renderPrometheus();
    EXPECT_TRUE(contains(text, "llmgate_route_outcomes_total{outcome=\"ok\"} 2"));
    EXPECT_TRUE(contains(text, "llmgate_route_outcomes_total{outcome=\"rate_limited\"} 1"));
    EXPECT_TRUE(contains(text, "llmgate_admission_rejections_total{reason=\"rate_limited\"} 1"));
    EXPECT_TRUE(contains(text, "llmgate_fallbacks_total 1"));
    EXPECT_TRUE(contains(text, "llmgate_backend_attempts_total 3"));
}

TEST_F(MetricsRegistryTest, LabelValuesAreEscaped) {
    auto &registry = llmgate::core::MetricsRegistry::instance();
    auto observation = registry.startRequest("/v1/\"quoted\"", 0);
    observation->complete(200, 0, 0);

    EXPECT_TRUE(contains(registry.renderPrometheus(), "endpoint=\"/v1/\\\"quoted\\\"\""));
}
