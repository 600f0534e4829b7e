#include "http/HttpServer.hpp"

#include "core/Metrics.hpp"
#include "llmgate/middleware/request_id.h"

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace {

using namespace std::chrono_literals;
using llmgate::routing::RouteOutcome;
using llmgate::routing::RouteResult;

drogon::HttpRequestPtr makeRequest(const std::string &body = {}) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPath("/v1/route");
    if (!body.empty()) {
        req->setBody(body);
    }
    return req;
}

// Runs the request-id filter the way drogon does before a handler that names it.
bool runRequestIdFilter(const drogon::HttpRequestPtr &req) {
    bool reachedHandler = false;
    llmgate::middleware::RequestIdMiddleware filter;
    filter.doFilter(
        req, [](const drogon::HttpResponsePtr &) {}, [&reachedHandler]() { reachedHandler = true; });
    return reachedHandler;
}

bool contains(const std::string &text, const std::string &needle) {
    return text.find(needle) != std::string::npos;
}

}  // namespace

TEST(HttpServerTest, RouteConstraintNamesTheRequestIdFilterClass) {
    EXPECT_EQ(std::string(llmgate::http::kRequestIdFilter), llmgate::middleware::RequestIdMiddleware::classTypeName());
}

TEST(HttpServerTest, FilteredRequestWithoutHeaderGetsGeneratedRequestId) {
    auto req = makeRequest(R"({"messages":[{"role":"user","content":"hi"}]})");
    ASSERT_TRUE(runRequestIdFilter(req));

    const auto requestId = llmgate::http::requestIdFor(req);
    EXPECT_FALSE(requestId.empty());
    EXPECT_EQ(req->getHeader("X-Request-ID"), requestId);
    EXPECT_NO_THROW(req->attributes()->get<std::shared_ptr<llmgate::core::RequestObservation>>("observability.metrics"));

    const auto request = llmgate::http::buildRouteRequest(req, llmgate::http::requestIdFor(req));
    EXPECT_EQ(request.requestId, requestId);
}

TEST(HttpServerTest, FilterKeepsClientRequestIdAndReplacesMalformedOnes) {
    auto req = makeRequest();
    req->addHeader("X-Request-ID", "client-req-42");
    ASSERT_TRUE(runRequestIdFilter(req));
    EXPECT_EQ(llmgate::http::requestIdFor(req), "client-req-42");

    auto malformed = makeRequest();
    malformed->addHeader("X-Request-ID", "bad id with spaces");
    ASSERT_TRUE(runRequestIdFilter(malformed));
    const auto replaced = llmgate::http::requestIdFor(malformed);
    EXPECT_FALSE(replaced.empty());
    EXPECT_NE(replaced, "bad id with spaces");
}

TEST(HttpServerTest, ExtractApiKeyPrefersBearerToken) {
    auto req = makeRequest();
    req->addHeader("Authorization", "bearer   lg_live_bearer ");
    req->addHeader("X-API-Key", "lg_live_header");
    EXPECT_EQ(llmgate::http::extractApiKey(req), "lg_live_bearer");
}

TEST(HttpServerTest, ExtractApiKeyFallsBackToHeader) {
    auto req = makeRequest();
    req->addHeader("Authorization", "Basic dXNlcjpwYXNz");
    req->addHeader("X-API-Key", " lg_live_header ");
    EXPECT_EQ(llmgate::http::extractApiKey(req), "lg_live_header");

    EXPECT_TRUE(llmgate::http::extractApiKey(makeRequest()).empty());
}

TEST(HttpServerTest, BuildRouteRequestReadsBodyBeforeHeaders) {
    auto req = makeRequest(R"({"messages":[{"role":"user","content":"hi"}],"mode":"lite","session_id":"body-session"})");
    req->addHeader("X-API-Key", "lg_live_key");
    req->addHeader("X-Routing-Mode", "performance");
    req->addHeader("X-Session-ID", "header-session");

    const auto request = llmgate::http::buildRouteRequest(req, "req-7");
    EXPECT_EQ(request.apiKey, "lg_live_key");
    EXPECT_EQ(request.requestId, "req-7");
    EXPECT_EQ(request.mode, "lite");
    EXPECT_EQ(request.sessionId, "body-session");
    EXPECT_EQ(request.payload["messages"][0]["content"].asString(), "hi");
}

TEST(HttpServerTest, BuildRouteRequestUsesHeadersWhenBodyIsSilent) {
    auto req = makeRequest(R"({"messages":[{"role":"user","content":"hi"}],"mode":7})");
    req->addHeader("X-Routing-Mode", "efficient");
    req->addHeader("X-Session-ID", "header-session");

    const auto request = llmgate::http::buildRouteRequest(req, "req-8");
    EXPECT_EQ(request.mode, "efficient");
    EXPECT_EQ(request.sessionId, "header-session");
}

TEST(HttpServerTest, InvalidJsonBodyBecomesNullPayload) {
    const auto invalid = llmgate::http::buildRouteRequest(makeRequest("{not json"), "req-9");
    EXPECT_TRUE(invalid.payload.isNull());
    EXPECT_FALSE(invalid.mode.has_value());

    const auto empty = llmgate::http::buildRouteRequest(makeRequest(), "req-10");
    EXPECT_TRUE(empty.payload.isNull());
}

TEST(HttpServerTest, SuccessResponseCarriesBackendHeader) {
    RouteResult result;
    result.outcome = RouteOutcome::Succeeded;
    result.backend = "DeepSeek";
    result.response["id"] = "cmpl-1";
    result.costUnits = 1;

    const auto response = llmgate::http::buildRouteResponse(result);
    EXPECT_EQ(response->getStatusCode(), drogon::k200OK);
    EXPECT_EQ(response->getHeader("X-Routed-Backend"), "DeepSeek");

    const auto json = response->getJsonObject();
    ASSERT_TRUE(json);
    EXPECT_EQ((*json)["model"].asString(), "DeepSeek");
    EXPECT_EQ((*json)["response"]["id"].asString(), "cmpl-1");
}

TEST(HttpServerTest, RejectionResponsesCarryStatusAndRetryAfter) {
    RouteResult limited;
    limited.outcome = RouteOutcome::RateLimited;
    limited.retryAfter = 1500ms;
    limited.message = "Rate limit exceeded";

    auto response = llmgate::http::buildRouteResponse(limited);
    EXPECT_EQ(response->getStatusCode(), drogon::k429TooManyRequests);
    EXPECT_EQ(response->getHeader("Retry-After"), "2");
    EXPECT_TRUE(response->getHeader("X-Routed-Backend").empty());
    EXPECT_EQ((*response->getJsonObject())["error"].asString(), "rate_limited");

    RouteResult quota;
    quota.outcome = RouteOutcome::QuotaExceeded;
    response = llmgate::http::buildRouteResponse(quota);
    EXPECT_EQ(response->getStatusCode(), drogon::k429TooManyRequests);
    EXPECT_TRUE(response->getHeader("Retry-After").empty());

    RouteResult unavailable;
    unavailable.outcome = RouteOutcome::AllBackendsFailed;
    response = llmgate::http::buildRouteResponse(unavailable);
    EXPECT_EQ(response->getStatusCode(), drogon::k503ServiceUnavailable);
    EXPECT_EQ((*response->getJsonObject())["error"].asString(), "all_models_failed");
}

TEST(HttpServerTest, RouteMetricsLabelObservationAndCountOutcome) {
    auto &registry = llmgate::core::MetricsRegistry::instance();
    registry.reset();

    auto req = makeRequest();
    auto observation = registry.startRequest("/v1/route", 64);
    req->attributes()->insert("observability.metrics", observation);

    RouteResult result;
    result.outcome = RouteOutcome::Succeeded;
    result.backend = "Claude";
    result.fallback = true;
    result.attempted = {"DeepSeek", "Claude"};
    result.tokensIn = 12;
    result.tokensOut = 30;
    llmgate::http::recordRouteMetrics(req, result);

    EXPECT_EQ(observation->backend(), "Claude");
    EXPECT_EQ(observation->tokensIn(), 12U);
    EXPECT_EQ(req->attributes()->get<std::uint64_t>("observability.tokens_out"), 30U);

    RouteResult rejected;
    rejected.outcome = RouteOutcome::QuotaExceeded;
    llmgate::http::recordRouteMetrics(makeRequest(), rejected);

    const auto text = registry.renderPrometheus();
    EXPECT_TRUE(contains(text, "llmgate_route_outcomes_total{outcome=\"ok\"} 1"));
    EXPECT_TRUE(contains(text, "llmgate_route_outcomes_total{outcome=\"quota_exceeded\"} 1"));
    EXPECT_TRUE(contains(text, "llmgate_admission_rejections_total{reason=\"quota_exceeded\"} 1"));
    registry.reset();
}
