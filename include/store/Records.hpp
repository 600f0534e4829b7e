#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmgate::store {

enum class HealthState {
    Up,
    Degraded,
    Down,
};

enum class SubscriptionStatus {
    Active,
    Trial,
    Expired,
    Cancelled,
    PastDue,
};

enum class ApiKeyStatus {
    Active,
    Revoked,
};

enum class AuthStrategy {
    BearerAuthorization,
    XApiKey,
    None,
};

std::string_view toString(HealthState state);
std::string_view toString(SubscriptionStatus status);
std::string_view toString(ApiKeyStatus status);
std::string_view toString(AuthStrategy strategy);

std::optional<HealthState> parseHealthState(std::string_view text);
std::optional<SubscriptionStatus> parseSubscriptionStatus(std::string_view text);
std::optional<ApiKeyStatus> parseApiKeyStatus(std::string_view text);
std::optional<AuthStrategy> parseAuthStrategy(std::string_view text);

// Only Active and Trial subscriptions may send traffic.
[[nodiscard]] bool isAdmitting(SubscriptionStatus status);

// Stored key records are keyed by the lowercase SHA-256 hex digest of the raw key.
std::string hashApiKey(std::string_view rawKey);

struct ApiKeyRecord {
    std::string keyHash;
    std::string keyPrefix;
    std::string subscriptionId;
    ApiKeyStatus status{ApiKeyStatus::Active};

    void validate() const;
};

struct SubscriptionRecord {
    std::string id;
    std::string customer;
    std::string planId;
    SubscriptionStatus status{SubscriptionStatus::Active};
    int priorityScore{0};
    std::int64_t dailyQuotaRemaining{-1};

    void validate() const;
};

struct ModelAccess {
    std::string backend;
    double costWeight{10.0};
    bool allowed{true};
};

struct SmartRoutingConfig {
    std::string defaultMode;
    bool enableSessionContinuity{false};
    std::chrono::seconds sessionTtl{3600};
    bool enableComplexityDetection{false};
    double correlationThreshold{0.7};
    double monthlyBudgetLimit{0.0};
};

struct PlanRecord {
    static constexpr double kDefaultCostWeight = 10.0;

    std::string id;
    int priorityScore{0};
    std::int64_t requestsPerDay{-1};
    std::int64_t rateLimitQps{0};
    std::vector<ModelAccess> modelAccess;
    SmartRoutingConfig smartRouting;

    [[nodiscard]] bool unlimited() const { return requestsPerDay == -1; }
    [[nodiscard]] std::vector<std::string> allowedBackends() const;
    [[nodiscard]] double costWeight(std::string_view backend) const;

    void validate() const;
};

struct BackendProfile {
    std::string name;
    std::string endpointUrl;
    std::string upstreamModel;
    HealthState health{HealthState::Up};
    double capacityScore{100.0};
    double costPerUnit{0.0};
    double avgLatencyMs{100.0};
    double successRate{100.0};
    std::uint64_t totalRequests{0};
    std::uint64_t failedRequests{0};
    bool active{true};
    std::chrono::milliseconds timeout{30000};
    AuthStrategy auth{AuthStrategy::BearerAuthorization};
    std::string apiKeyEnv;

    // Inactive or Down backends never take traffic; Degraded ones remain a last resort.
    [[nodiscard]] bool eligible() const { return active && health != HealthState::Down; }

    void validate() const;
};

}  // namespace llmgate::store
