#include "providers/HttpBackendClient.hpp"

#include "llmgate/environment.h"

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace llmgate::providers {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string serialize(const Json::Value &payload) {
    Json::StreamWriterBuilder writerBuilder;
    writerBuilder["indentation"] = "";
    return Json::writeString(writerBuilder, payload);
}

}  // namespace

HttpBackendClient::HttpBackendClient(HttpClientConfig config) : config_(std::move(config)) {}

HttpBackendClient::~HttpBackendClient() = default;

ProviderResult<CompletionResponse> HttpBackendClient::complete(const store::BackendProfile &backend,
                                                               const CompletionRequest &request,
                                                               const RequestContext &context) {
    ProviderResult<CompletionResponse> result;

    if (config_.dryRun) {
        result.error = makeError(backend, "dry_run", "dry_run", "DRY_RUN is enabled; upstream call skipped.",
                                 context.requestId, 0.0);
        return result;
    }

    if (backend.endpointUrl.empty()) {
        result.error = makeError(backend, "provider_error", "missing_endpoint",
                                 "Backend endpoint is not configured. Please update gateway.yaml.", context.requestId, 0.0);
        return result;
    }

    std::string apiKey;
    if (backend.auth != store::AuthStrategy::None) {
        if (backend.apiKeyEnv.empty()) {
            result.error = makeError(backend, "provider_error", "missing_api_key_env",
                                     "Backend API key environment variable is not configured.", context.requestId, 0.0);
            return result;
        }
        auto value = getEnv(backend.apiKeyEnv);
        if (!value.has_value() || value->empty()) {
            result.error = makeError(backend, "auth_error", "missing_api_key",
                                     "API key environment variable is empty or undefined.", context.requestId, 0.0);
            return result;
        }
        apiKey = *value;
    }

    if (!admitThroughBreaker(backend.name)) {
        result.error = makeError(backend, "provider_error", "circuit_open",
                                 "Backend circuit breaker open after repeated failures.", context.requestId,
                                 std::chrono::duration<double>(config_.circuitBreakerCooldown).count());
        return result;
    }

    const auto headers = buildHeaders(backend, apiKey, context);
    const auto response = send(backend.endpointUrl, headers, serialize(request.payload), backend.timeout);

    auto providerRequestId = extractRequestId(response);
    const auto requestId = providerRequestId.empty() ? context.requestId : providerRequestId;
    const auto retryAfter = parseRetryAfter(response);

    if (response.error.code != cpr::ErrorCode::OK) {
        const bool timedOut = response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT;
        result.error = makeError(backend, "provider_error", timedOut ? "timeout" : "network_error", response.error.message,
                                 requestId, retryAfter);
    } else if (response.status_code == 401 || response.status_code == 403) {
        result.error = makeError(backend, "auth_error", std::to_string(response.status_code),
                                 response.text.empty() ? "Authentication with upstream backend failed." : response.text,
                                 requestId, 0.0);
    } else if (response.status_code >= 200 && response.status_code < 300) {
        Json::Value payload;
        std::string errs;
        auto reader = std::unique_ptr<Json::CharReader>(Json::CharReaderBuilder().newCharReader());
        if (!reader->parse(response.text.c_str(), response.text.c_str() + response.text.size(), &payload, &errs)) {
            result.error = makeError(backend, "provider_error", "invalid_json",
                                     errs.empty() ? "Backend returned invalid JSON payload." : errs, requestId, retryAfter);
        } else {
            CompletionResponse completion;
            completion.usage = extractUsage(payload);
            completion.payload = std::move(payload);
            completion.providerRequestId = std::move(providerRequestId);
            completion.statusCode = response.status_code;
            result.data = std::move(completion);
            recordSuccess(backend.name);
            return result;
        }
    } else {
        result.error = makeError(backend, "provider_error", std::to_string(response.status_code),
                                 response.text.empty() ? "Backend returned an error response." : response.text,
                                 requestId, retryAfter);
    }

    recordFailure(backend.name);
    return result;
}

bool HttpBackendClient::circuitOpen(const std::string &backend) const {
    std::lock_guard guard(mutex_);
    auto it = breakers_.find(backend);
    if (it == breakers_.end()) {
        return false;
    }
    const auto &openUntil = it->second.openUntil;
    return openUntil != std::chrono::steady_clock::time_point{} && std::chrono::steady_clock::now() < openUntil;
}

cpr::Header HttpBackendClient::buildHeaders(const store::BackendProfile &backend,
                                            const std::string &apiKey,
                                            const RequestContext &context) const {
    cpr::Header header;
    header["Content-Type"] = "application/json";
    header["Accept"] = "application/json";
    header["User-Agent"] = config_.userAgent;
    if (!context.requestId.empty()) {
        header["X-Request-ID"] = context.requestId;
    }

    for (const auto &entry : config_.defaultHeaders) {
        header[entry.first] = entry.second;
    }

    switch (backend.auth) {
        case store::AuthStrategy::BearerAuthorization:
            header["Authorization"] = "Bearer " + apiKey;
            break;
        case store::AuthStrategy::XApiKey:
            header["x-api-key"] = apiKey;
            break;
        case store::AuthStrategy::None:
            break;
    }
    return header;
}

cpr::Response HttpBackendClient::send(const std::string &url,
                                      const cpr::Header &headers,
                                      const std::string &body,
                                      std::chrono::milliseconds timeout) {
    cpr::Session session;
    session.SetUrl(cpr::Url{url});
    session.SetTimeout(cpr::Timeout{timeout});
    session.SetConnectTimeout(cpr::ConnectTimeout{std::min(config_.connectTimeout, timeout)});
    session.SetHeader(headers);
    session.SetBody(cpr::Body{body});
    return session.Post();
}

ProviderError HttpBackendClient::makeError(const store::BackendProfile &backend,
                                           const std::string &type,
                                           const std::string &code,
                                           const std::string &message,
                                           const std::string &requestId,
                                           double retryAfter) const {
    ProviderError error;
    error.type = type;
    error.message = message;
    error.provider = backend.name;
    error.code = code;
    error.requestId = requestId;
    error.retryAfter = retryAfter;
    return error;
}

bool HttpBackendClient::admitThroughBreaker(const std::string &backend) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard guard(mutex_);
    auto &breaker = breakers_[backend];
    if (breaker.openUntil == std::chrono::steady_clock::time_point{}) {
        return true;
    }
    if (now < breaker.openUntil) {
        return false;
    }
    breaker.openUntil = {};
    breaker.failures = 0;
    return true;
}

void HttpBackendClient::recordFailure(const std::string &backend) {
    std::lock_guard guard(mutex_);
    auto &breaker = breakers_[backend];
    breaker.failures += 1;
    if (breaker.failures >= config_.circuitBreakerThreshold) {
        breaker.openUntil = std::chrono::steady_clock::now() + config_.circuitBreakerCooldown;
        LOG_WARN << "Circuit breaker opened for backend " << backend << " after " << breaker.failures << " failures";
    }
}

void HttpBackendClient::recordSuccess(const std::string &backend) {
    std::lock_guard guard(mutex_);
    auto &breaker = breakers_[backend];
    breaker.failures = 0;
    breaker.openUntil = {};
}

std::string HttpBackendClient::extractRequestId(const cpr::Response &response) const {
    static const std::vector<std::string> candidates = {"x-request-id", "x-requestid", "request-id"};
    for (const auto &candidate : candidates) {
        auto it = response.header.find(candidate);
        if (it != response.header.end()) {
            return it->second;
        }
    }

    for (const auto &entry : response.header) {
        if (toLower(entry.first) == "x-request-id") {
            return entry.second;
        }
    }
    return {};
}

double HttpBackendClient::parseRetryAfter(const cpr::Response &response) const {
    for (const auto &entry : response.header) {
        if (toLower(entry.first) == "retry-after") {
            try {
                return std::stod(entry.second);
            } catch (const std::exception &) {
                return 0.0;
            }
        }
    }
    return 0.0;
}

Usage HttpBackendClient::extractUsage(const Json::Value &payload) const {
    Usage usage;
    if (!payload.isObject() || !payload.isMember("usage") || !payload["usage"].isObject()) {
        usage.note = "backend_did_not_return_usage";
        return usage;
    }

    const auto &rawUsage = payload["usage"];
    if (rawUsage.isMember("prompt_tokens")) {
        usage.promptTokens = rawUsage["prompt_tokens"].asUInt64();
    }
    if (rawUsage.isMember("completion_tokens")) {
        usage.completionTokens = rawUsage["completion_tokens"].asUInt64();
    }
    if (rawUsage.isMember("total_tokens")) {
        usage.totalTokens = rawUsage["total_tokens"].asUInt64();
    } else {
        usage.totalTokens = usage.promptTokens + usage.completionTokens;
    }
    return usage;
}

}  // namespace llmgate::providers
