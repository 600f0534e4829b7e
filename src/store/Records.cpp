#include "store/Records.hpp"

#include <drogon/utils/Utilities.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace llmgate::store {
namespace {

std::string normalize(std::string_view text) {
    std::string value;
    value.reserve(text.size());
    for (char ch : text) {
        if (ch == '_' || ch == '-' || ch == ' ') {
            continue;
        }
        value.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return value;
}

void require(bool condition, const std::string &message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

}  // namespace

std::string_view toString(HealthState state) {
    switch (state) {
        case HealthState::Up:
            return "Up";
        case HealthState::Degraded:
            return "Degraded";
        case HealthState::Down:
            return "Down";
    }
    return "Down";
}

std::string_view toString(SubscriptionStatus status) {
    switch (status) {
        case SubscriptionStatus::Active:
            return "Active";
        case SubscriptionStatus::Trial:
            return "Trial";
        case SubscriptionStatus::Expired:
            return "Expired";
        case SubscriptionStatus::Cancelled:
            return "Cancelled";
        case SubscriptionStatus::PastDue:
            return "PastDue";
    }
    return "Expired";
}

std::string_view toString(ApiKeyStatus status) {
    return status == ApiKeyStatus::Active ? "Active" : "Revoked";
}

std::string_view toString(AuthStrategy strategy) {
    switch (strategy) {
        case AuthStrategy::BearerAuthorization:
            return "bearer";
        case AuthStrategy::XApiKey:
            return "x_api_key";
        case AuthStrategy::None:
            return "none";
    }
    return "none";
}

std::optional<HealthState> parseHealthState(std::string_view text) {
    const auto value = normalize(text);
    if (value == "up") {
        return HealthState::Up;
    }
    if (value == "degraded") {
        return HealthState::Degraded;
    }
    if (value == "down") {
        return HealthState::Down;
    }
    return std::nullopt;
}

std::optional<SubscriptionStatus> parseSubscriptionStatus(std::string_view text) {
    const auto value = normalize(text);
    if (value == "active") {
        return SubscriptionStatus::Active;
    }
    if (value == "trial") {
        return SubscriptionStatus::Trial;
    }
    if (value == "expired") {
        return SubscriptionStatus::Expired;
    }
    if (value == "cancelled" || value == "canceled") {
        return SubscriptionStatus::Cancelled;
    }
    if (value == "pastdue") {
        return SubscriptionStatus::PastDue;
    }
    return std::nullopt;
}

std::optional<ApiKeyStatus> parseApiKeyStatus(std::string_view text) {
    const auto value = normalize(text);
    if (value == "active") {
        return ApiKeyStatus::Active;
    }
    if (value == "revoked") {
        return ApiKeyStatus::Revoked;
    }
    return std::nullopt;
}

std::optional<AuthStrategy> parseAuthStrategy(std::string_view text) {
    const auto value = normalize(text);
    if (value == "bearer" || value == "bearerauthorization") {
        return AuthStrategy::BearerAuthorization;
    }
    if (value == "xapikey") {
        return AuthStrategy::XApiKey;
    }
    if (value == "none") {
        return AuthStrategy::None;
    }
    return std::nullopt;
}

std::string hashApiKey(std::string_view rawKey) {
    auto digest = drogon::utils::getSha256(rawKey.data(), rawKey.size());
    std::transform(digest.begin(), digest.end(), digest.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return digest;
}

bool isAdmitting(SubscriptionStatus status) {
    return status == SubscriptionStatus::Active || status == SubscriptionStatus::Trial;
}

void ApiKeyRecord::validate() const {
    require(!keyHash.empty(), "API key record requires a key hash");
    require(!subscriptionId.empty(), "API key record requires a subscription");
}

void SubscriptionRecord::validate() const {
    require(!id.empty(), "subscription requires an id");
    require(!planId.empty(), "subscription " + id + " requires a plan");
    require(priorityScore >= 0 && priorityScore <= 100, "subscription " + id + " priority must be within 0..100");
    require(dailyQuotaRemaining >= -1, "subscription " + id + " quota remaining must be -1 or positive");
}

std::vector<std::string> PlanRecord::allowedBackends() const {
    std::vector<std::string> names;
    names.reserve(modelAccess.size());
    for (const auto &access : modelAccess) {
        if (access.allowed) {
            names.push_back(access.backend);
        }
    }
    return names;
}

double PlanRecord::costWeight(std::string_view backend) const {
    auto it = std::find_if(modelAccess.begin(), modelAccess.end(), [&](const ModelAccess &access) {
        return access.allowed && access.backend == backend;
    });
    return it == modelAccess.end() ? kDefaultCostWeight : it->costWeight;
}

void PlanRecord::validate() const {
    require(!id.empty(), "plan requires an id");
    require(priorityScore >= 0 && priorityScore <= 100, "plan " + id + " priority must be within 0..100");
    require(requestsPerDay >= -1, "plan " + id + " requests limit must be -1 (unlimited) or positive");
    require(rateLimitQps >= 0, "plan " + id + " rate limit must be 0 (no limit) or positive");
    require(smartRouting.correlationThreshold >= 0.0 && smartRouting.correlationThreshold <= 1.0,
            "plan " + id + " correlation threshold must be within 0..1");
    require(smartRouting.sessionTtl.count() > 0, "plan " + id + " session ttl must be positive");
    require(smartRouting.monthlyBudgetLimit >= 0.0, "plan " + id + " budget limit cannot be negative");
    for (const auto &access : modelAccess) {
        require(!access.backend.empty(), "plan " + id + " has a model access entry without a backend");
        require(access.costWeight >= 0.0, "plan " + id + " cost weight cannot be negative");
    }
}

void BackendProfile::validate() const {
    require(!name.empty(), "backend requires a name");
    require(capacityScore >= 0.0 && capacityScore <= 100.0, "backend " + name + " capacity score must be within 0..100");
    require(costPerUnit >= 0.0, "backend " + name + " cost per unit cannot be negative");
    require(avgLatencyMs >= 0.0, "backend " + name + " average latency cannot be negative");
    require(successRate >= 0.0 && successRate <= 100.0, "backend " + name + " success rate must be within 0..100");
    require(timeout.count() > 0, "backend " + name + " timeout must be positive");
    require(endpointUrl.rfind("http://", 0) == 0 || endpointUrl.rfind("https://", 0) == 0,
            "backend " + name + " endpoint must start with http:// or https://");
}

}  // namespace llmgate::store
