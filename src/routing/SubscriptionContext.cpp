#include "routing/SubscriptionContext.hpp"

#include <algorithm>

namespace llmgate::routing {

double SubscriptionContext::costWeight(const std::string &backend) const {
    auto it = costWeights.find(backend);
    return it == costWeights.end() ? store::PlanRecord::kDefaultCostWeight : it->second;
}

Json::Value SubscriptionContext::toJson() const {
    Json::Value json(Json::objectValue);
    json["subscription_id"] = subscriptionId;
    json["customer"] = customer;
    json["plan_id"] = planId;
    json["status"] = std::string(store::toString(status));
    json["priority_score"] = priorityScore;
    json["daily_quota_limit"] = static_cast<Json::Int64>(dailyQuotaLimit);
    json["daily_quota_remaining"] = static_cast<Json::Int64>(dailyQuotaRemaining);
    json["rate_limit_qps"] = static_cast<Json::Int64>(rateLimitQps);
    json["masked_key"] = maskedKey;

    Json::Value allowed(Json::arrayValue);
    for (const auto &backend : allowedBackends) {
        allowed.append(backend);
    }
    json["allowed_backends"] = allowed;

    Json::Value weights(Json::objectValue);
    for (const auto &[backend, weight] : costWeights) {
        weights[backend] = weight;
    }
    json["cost_weights"] = weights;

    Json::Value smart(Json::objectValue);
    smart["default_mode"] = smartRouting.defaultMode;
    smart["enable_session_continuity"] = smartRouting.enableSessionContinuity;
    smart["session_ttl_seconds"] = static_cast<Json::Int64>(smartRouting.sessionTtl.count());
    smart["enable_task_complexity_detection"] = smartRouting.enableComplexityDetection;
    smart["correlation_threshold"] = smartRouting.correlationThreshold;
    smart["monthly_budget_limit"] = smartRouting.monthlyBudgetLimit;
    json["smart_routing"] = smart;
    return json;
}

std::optional<SubscriptionContext> SubscriptionContext::fromJson(const Json::Value &json) {
    if (!json.isObject() || !json["subscription_id"].isString() || !json["plan_id"].isString()) {
        return std::nullopt;
    }
    const auto status = store::parseSubscriptionStatus(json["status"].asString());
    if (!status.has_value()) {
        return std::nullopt;
    }

    SubscriptionContext context;
    context.subscriptionId = json["subscription_id"].asString();
    context.customer = json["customer"].asString();
    context.planId = json["plan_id"].asString();
    context.status = *status;
    context.priorityScore = json["priority_score"].asInt();
    context.dailyQuotaLimit = json["daily_quota_limit"].asInt64();
    context.dailyQuotaRemaining = json["daily_quota_remaining"].asInt64();
    context.rateLimitQps = json["rate_limit_qps"].asInt64();
    context.maskedKey = json["masked_key"].asString();

    for (const auto &backend : json["allowed_backends"]) {
        context.allowedBackends.push_back(backend.asString());
    }
    const auto &weights = json["cost_weights"];
    if (weights.isObject()) {
        for (const auto &name : weights.getMemberNames()) {
            context.costWeights[name] = weights[name].asDouble();
        }
    }

    const auto &smart = json["smart_routing"];
    if (smart.isObject()) {
        context.smartRouting.defaultMode = smart["default_mode"].asString();
        context.smartRouting.enableSessionContinuity = smart["enable_session_continuity"].asBool();
        context.smartRouting.sessionTtl = std::chrono::seconds(smart["session_ttl_seconds"].asInt64());
        context.smartRouting.enableComplexityDetection = smart["enable_task_complexity_detection"].asBool();
        context.smartRouting.correlationThreshold = smart["correlation_threshold"].asDouble();
        context.smartRouting.monthlyBudgetLimit = smart["monthly_budget_limit"].asDouble();
    }
    return context;
}

SubscriptionContext buildSubscriptionContext(const store::SubscriptionRecord &subscription,
                                             const store::PlanRecord &plan,
                                             const std::string &maskedKey) {
    SubscriptionContext context;
    context.subscriptionId = subscription.id;
    context.customer = subscription.customer;
    context.planId = plan.id;
    context.status = subscription.status;
    context.priorityScore = subscription.priorityScore > 0 ? subscription.priorityScore : plan.priorityScore;
    context.dailyQuotaLimit = plan.requestsPerDay;
    if (plan.unlimited()) {
        context.dailyQuotaRemaining = -1;
    } else if (subscription.dailyQuotaRemaining < 0) {
        context.dailyQuotaRemaining = plan.requestsPerDay;
    } else {
        context.dailyQuotaRemaining = std::min(subscription.dailyQuotaRemaining, plan.requestsPerDay);
    }
    context.rateLimitQps = plan.rateLimitQps;
    context.allowedBackends = plan.allowedBackends();
    for (const auto &access : plan.modelAccess) {
        if (access.allowed) {
            context.costWeights[access.backend] = access.costWeight;
        }
    }
    context.smartRouting = plan.smartRouting;
    context.maskedKey = maskedKey;
    return context;
}

}  // namespace llmgate::routing
