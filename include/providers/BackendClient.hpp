#pragma once

#include "store/Records.hpp"

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>

namespace llmgate::providers {

struct RequestContext {
    std::string requestId;
    std::string subscriptionId;
};

struct Usage {
    std::uint64_t promptTokens{0};
    std::uint64_t completionTokens{0};
    std::uint64_t totalTokens{0};
    std::string note;
};

struct ProviderError {
    std::string type;
    std::string message;
    std::string provider;
    std::string code;
    std::string requestId;
    double retryAfter{0.0};
};

template <typename T>
struct ProviderResult {
    std::optional<T> data;
    std::optional<ProviderError> error;

    [[nodiscard]] bool ok() const { return data.has_value(); }
};

struct CompletionRequest {
    Json::Value payload;
};

struct CompletionResponse {
    Json::Value payload;
    Usage usage;
    std::string providerRequestId;
    long statusCode{0};
};

// One attempt against one backend, bounded by the backend's timeout. Implementations never retry;
// the router decides which backend is tried next.
class BackendClient {
   public:
    virtual ~BackendClient() = default;

    virtual ProviderResult<CompletionResponse> complete(const store::BackendProfile &backend,
                                                        const CompletionRequest &request,
                                                        const RequestContext &context) = 0;
};

}  // namespace llmgate::providers
