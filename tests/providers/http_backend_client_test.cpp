#include "providers/HttpBackendClient.hpp"

#include "support/TestSupport.hpp"

#include <gtest/gtest.h>

#include <deque>
#include <string>
#include <vector>

namespace {

using namespace std::chrono_literals;
using llmgate::providers::CompletionRequest;
using llmgate::providers::HttpBackendClient;
using llmgate::providers::HttpClientConfig;
using llmgate::providers::RequestContext;
using llmgate::store::AuthStrategy;
using llmgate::testing::ScopedEnvVar;

class ScriptedHttpBackendClient : public HttpBackendClient {
   public:
    struct SentRequest {
        std::string url;
        cpr::Header headers;
        std::string body;
        std::chrono::milliseconds timeout;
    };

    using HttpBackendClient::HttpBackendClient;

    cpr::Header exposeBuildHeaders(const llmgate::store::BackendProfile &backend,
                                   const std::string &apiKey,
                                   const RequestContext &context) const {
        return HttpBackendClient::buildHeaders(backend, apiKey, context);
    }

    void enqueue(cpr::Response response) { responses_.push_back(std::move(response)); }

    const std::vector<SentRequest> &sent() const { return sent_; }

   protected:
    cpr::Response send(const std::string &url, const cpr::Header &headers, const std::string &body,
                       std::chrono::milliseconds timeout) override {
        sent_.push_back(SentRequest{url, headers, body, timeout});
        if (responses_.empty()) {
            cpr::Response fallback;
            fallback.status_code = 500;
            return fallback;
        }
        auto response = std::move(responses_.front());
        responses_.pop_front();
        return response;
    }

   private:
    std::deque<cpr::Response> responses_;
    std::vector<SentRequest> sent_;
};

cpr::Response httpResponse(long status, std::string body, cpr::Header header = {}) {
    cpr::Response response;
    response.status_code = status;
    response.text = std::move(body);
    response.header = std::move(header);
    return response;
}

cpr::Response transportFailure(cpr::ErrorCode code, std::string message) {
    cpr::Response response;
    response.error.code = code;
    response.error.message = std::move(message);
    return response;
}

HttpClientConfig makeConfig() {
    HttpClientConfig config;
    config.defaultHeaders = {{"X-Gateway", "llmgate"}};
    config.circuitBreakerThreshold = 3;
    config.circuitBreakerCooldown = 60s;
    return config;
}

class HttpBackendClientTest : public ::testing::Test {
   protected:
    HttpBackendClientTest() : client_(makeConfig()), keyGuard_("LLMGATE_TEST_BACKEND_KEY") {
        keyGuard_.set("secret-key");
        backend_ = llmgate::testing::makeBackend("DeepSeek");
        backend_.auth = AuthStrategy::BearerAuthorization;
        backend_.apiKeyEnv = "LLMGATE_TEST_BACKEND_KEY";
        backend_.timeout = 1500ms;
        context_.requestId = "req-42";
        context_.subscriptionId = "sub-1";
        request_.payload = llmgate::testing::chatPayload("hello");
    }

    ScriptedHttpBackendClient client_;
    ScopedEnvVar keyGuard_;
    llmgate::store::BackendProfile backend_;
    RequestContext context_;
    CompletionRequest request_;
};

}  // namespace

TEST_F(HttpBackendClientTest, BuildHeadersIncludesAuthAndDefaults) {
    auto header = client_.exposeBuildHeaders(backend_, "secret", context_);

    EXPECT_EQ(header["Content-Type"], "application/json");
    EXPECT_EQ(header["Accept"], "application/json");
    EXPECT_EQ(header["User-Agent"], "llmgate/0.1.0");
    EXPECT_EQ(header["X-Request-ID"], "req-42");
    EXPECT_EQ(header["X-Gateway"], "llmgate");
    EXPECT_EQ(header["Authorization"], "Bearer secret");
}

TEST_F(HttpBackendClientTest, BuildHeadersFollowsAuthStrategy) {
    backend_.auth = AuthStrategy::XApiKey;
    auto header = client_.exposeBuildHeaders(backend_, "secret", context_);
    EXPECT_EQ(header["x-api-key"], "secret");
    EXPECT_EQ(header.count("Authorization"), 0U);

    backend_.auth = AuthStrategy::None;
    header = client_.exposeBuildHeaders(backend_, "", context_);
    EXPECT_EQ(header.count("Authorization"), 0U);
    EXPECT_EQ(header.count("x-api-key"), 0U);
}

TEST_F(HttpBackendClientTest, DryRunSkipsUpstreamCall) {
    auto config = makeConfig();
    config.dryRun = true;
    ScriptedHttpBackendClient client(config);

    auto result = client.complete(backend_, request_, context_);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->code, "dry_run");
    EXPECT_EQ(result.error->provider, "DeepSeek");
    EXPECT_TRUE(client.sent().empty());
}

TEST_F(HttpBackendClientTest, MissingConfigurationFailsBeforeSending) {
    auto noEndpoint = backend_;
    noEndpoint.endpointUrl.clear();
    EXPECT_EQ(client_.complete(noEndpoint, request_, context_).error->code, "missing_endpoint");

    auto noEnvName = backend_;
    noEnvName.apiKeyEnv.clear();
    EXPECT_EQ(client_.complete(noEnvName, request_, context_).error->code, "missing_api_key_env");

    keyGuard_.clear();
    auto missingKey = client_.complete(backend_, request_, context_);
    EXPECT_EQ(missingKey.error->type, "auth_error");
    EXPECT_EQ(missingKey.error->code, "missing_api_key");

    EXPECT_TRUE(client_.sent().empty());
}

TEST_F(HttpBackendClientTest, NoAuthBackendNeedsNoKey) {
    keyGuard_.clear();
    backend_.auth = AuthStrategy::None;
    backend_.apiKeyEnv.clear();
    client_.enqueue(httpResponse(200, R"({"id":"x"})"));

    EXPECT_TRUE(client_.complete(backend_, request_, context_).ok());
    ASSERT_EQ(client_.sent().size(), 1U);
}

TEST_F(HttpBackendClientTest, SuccessfulResponseIsParsedWithUsage) {
    client_.enqueue(httpResponse(
        200, R"({"id":"cmpl-1","usage":{"prompt_tokens":7,"completion_tokens":5}})",
        cpr::Header{{"X-Request-ID", "upstream-9"}}));

    auto result = client_.complete(backend_, request_, context_);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.data->payload["id"].asString(), "cmpl-1");
    EXPECT_EQ(result.data->usage.promptTokens, 7U);
    EXPECT_EQ(result.data->usage.completionTokens, 5U);
    EXPECT_EQ(result.data->usage.totalTokens, 12U);
    EXPECT_EQ(result.data->providerRequestId, "upstream-9");
    EXPECT_EQ(result.data->statusCode, 200);

    ASSERT_EQ(client_.sent().size(), 1U);
    const auto &sent = client_.sent().front();
    EXPECT_EQ(sent.url, backend_.endpointUrl);
    EXPECT_EQ(sent.timeout, 1500ms);
    EXPECT_NE(sent.body.find("\"messages\""), std::string::npos);
}

TEST_F(HttpBackendClientTest, MissingUsageIsNoted) {
    client_.enqueue(httpResponse(200, R"({"id":"cmpl-1"})"));
    auto result = client_.complete(backend_, request_, context_);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.data->usage.totalTokens, 0U);
    EXPECT_EQ(result.data->usage.note, "backend_did_not_return_usage");
}

TEST_F(HttpBackendClientTest, ErrorResponsesAreClassified) {
    client_.enqueue(httpResponse(200, "not json"));
    EXPECT_EQ(client_.complete(backend_, request_, context_).error->code, "invalid_json");

    client_.enqueue(httpResponse(401, ""));
    auto unauthorized = client_.complete(backend_, request_, context_);
    EXPECT_EQ(unauthorized.error->type, "auth_error");
    EXPECT_EQ(unauthorized.error->code, "401");

    auto config = makeConfig();
    config.circuitBreakerThreshold = 10;
    ScriptedHttpBackendClient client(config);

    client.enqueue(transportFailure(cpr::ErrorCode::OPERATION_TIMEDOUT, "Operation timed out"));
    auto timedOut = client.complete(backend_, request_, context_);
    EXPECT_EQ(timedOut.error->code, "timeout");
    EXPECT_EQ(timedOut.error->requestId, "req-42");

    client.enqueue(httpResponse(429, "slow down", cpr::Header{{"Retry-After", "7"}}));
    auto throttled = client.complete(backend_, request_, context_);
    EXPECT_EQ(throttled.error->code, "429");
    EXPECT_DOUBLE_EQ(throttled.error->retryAfter, 7.0);
}

TEST_F(HttpBackendClientTest, FailuresAreNeverRetried) {
    client_.enqueue(httpResponse(503, "unavailable"));
    client_.enqueue(httpResponse(200, R"({"id":"late"})"));

    auto result = client_.complete(backend_, request_, context_);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(client_.sent().size(), 1U);
}

TEST_F(HttpBackendClientTest, CircuitOpensAfterConsecutiveFailures) {
    for (int i = 0; i < 3; ++i) {
        client_.enqueue(httpResponse(500, "boom"));
        EXPECT_EQ(client_.complete(backend_, request_, context_).error->code, "500");
    }
    EXPECT_TRUE(client_.circuitOpen("DeepSeek"));

    auto rejected = client_.complete(backend_, request_, context_);
    EXPECT_EQ(rejected.error->code, "circuit_open");
    EXPECT_DOUBLE_EQ(rejected.error->retryAfter, 60.0);
    EXPECT_EQ(client_.sent().size(), 3U);

    auto other = llmgate::testing::makeBackend("Grok");
    client_.enqueue(httpResponse(200, R"({"id":"ok"})"));
    EXPECT_TRUE(client_.complete(other, request_, context_).ok());
}

TEST_F(HttpBackendClientTest, SuccessResetsFailureCount) {
    client_.enqueue(httpResponse(500, "boom"));
    client_.enqueue(httpResponse(500, "boom"));
    client_.enqueue(httpResponse(200, R"({"id":"ok"})"));
    client_.enqueue(httpResponse(500, "boom"));
    client_.enqueue(httpResponse(500, "boom"));

    for (int i = 0; i < 5; ++i) {
        client_.complete(backend_, request_, context_);
    }
    EXPECT_FALSE(client_.circuitOpen("DeepSeek"));
}
