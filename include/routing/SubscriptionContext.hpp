#pragma once

#include "store/Records.hpp"

#include <json/json.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace llmgate::routing {

// Cached view of a caller's entitlements, assembled from the key, subscription and plan records.
struct SubscriptionContext {
    std::string subscriptionId;
    std::string customer;
    std::string planId;
    store::SubscriptionStatus status{store::SubscriptionStatus::Active};
    int priorityScore{0};
    std::int64_t dailyQuotaLimit{-1};
    std::int64_t dailyQuotaRemaining{-1};
    std::int64_t rateLimitQps{0};
    std::vector<std::string> allowedBackends;
    std::map<std::string, double> costWeights;
    store::SmartRoutingConfig smartRouting;
    std::string maskedKey;

    [[nodiscard]] bool unlimited() const { return dailyQuotaLimit == -1; }
    [[nodiscard]] bool rateLimited() const { return rateLimitQps > 0; }
    [[nodiscard]] double costWeight(const std::string &backend) const;

    Json::Value toJson() const;
    static std::optional<SubscriptionContext> fromJson(const Json::Value &json);
};

// Builds the context for `subscription` on `plan`; quota remaining is clamped to the plan limit.
SubscriptionContext buildSubscriptionContext(const store::SubscriptionRecord &subscription,
                                             const store::PlanRecord &plan,
                                             const std::string &maskedKey);

}  // namespace llmgate::routing
