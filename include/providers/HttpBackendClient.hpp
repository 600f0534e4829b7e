#pragma once

#include "providers/BackendClient.hpp"

#include <cpr/cpr.h>

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace llmgate::providers {

struct HttpClientConfig {
    std::unordered_map<std::string, std::string> defaultHeaders;
    std::chrono::milliseconds connectTimeout{5000};
    bool dryRun{false};
    std::size_t circuitBreakerThreshold{3};
    std::chrono::milliseconds circuitBreakerCooldown{std::chrono::seconds(10)};
    std::string userAgent{"llmgate/0.1.0"};
};

// POSTs the payload to the backend endpoint with cpr. Each backend has its own circuit breaker:
// after `circuitBreakerThreshold` consecutive failures calls fail fast for the cooldown.
class HttpBackendClient : public BackendClient {
   public:
    explicit HttpBackendClient(HttpClientConfig config);
    ~HttpBackendClient() override;

    ProviderResult<CompletionResponse> complete(const store::BackendProfile &backend,
                                                const CompletionRequest &request,
                                                const RequestContext &context) override;

    [[nodiscard]] bool circuitOpen(const std::string &backend) const;

   protected:
    cpr::Header buildHeaders(const store::BackendProfile &backend, const std::string &apiKey, const RequestContext &context) const;

    virtual cpr::Response send(const std::string &url, const cpr::Header &headers, const std::string &body,
                               std::chrono::milliseconds timeout);

   private:
    struct CircuitBreakerState {
        std::size_t failures{0};
        std::chrono::steady_clock::time_point openUntil{};
    };

    ProviderError makeError(const store::BackendProfile &backend,
                            const std::string &type,
                            const std::string &code,
                            const std::string &message,
                            const std::string &requestId,
                            double retryAfter) const;

    bool admitThroughBreaker(const std::string &backend);
    void recordFailure(const std::string &backend);
    void recordSuccess(const std::string &backend);

    std::string extractRequestId(const cpr::Response &response) const;
    double parseRetryAfter(const cpr::Response &response) const;
    Usage extractUsage(const Json::Value &payload) const;

    HttpClientConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, CircuitBreakerState> breakers_;
};

}  // namespace llmgate::providers
