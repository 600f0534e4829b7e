#include "store/InMemoryStore.hpp"

#include "llmgate/environment.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace llmgate::store {
namespace {

std::string scalar(const YAML::Node &node, const char *key, const std::string &fallback = {}) {
    const auto value = node[key];
    if (!value) {
        return fallback;
    }
    return expandEnvPlaceholder(value.as<std::string>(fallback));
}

template <typename T>
T number(const YAML::Node &node, const char *key, T fallback) {
    const auto text = scalar(node, key);
    if (text.empty()) {
        return fallback;
    }
    try {
        return YAML::Node(text).as<T>();
    } catch (const YAML::Exception &) {
        throw std::invalid_argument(std::string("catalog field '") + key + "' has invalid value '" + text + "'");
    }
}

template <typename Enum, typename Parser>
Enum enumeration(const YAML::Node &node, const char *key, Enum fallback, Parser parser) {
    const auto text = scalar(node, key);
    if (text.empty()) {
        return fallback;
    }
    if (auto parsed = parser(text)) {
        return *parsed;
    }
    throw std::invalid_argument(std::string("catalog field '") + key + "' has unknown value '" + text + "'");
}

BackendProfile parseBackend(const YAML::Node &node) {
    BackendProfile profile;
    profile.name = scalar(node, "name");
    profile.endpointUrl = scalar(node, "endpoint");
    profile.upstreamModel = scalar(node, "upstream_model");
    profile.health = enumeration(node, "health", HealthState::Up, parseHealthState);
    profile.capacityScore = number<double>(node, "capacity_score", profile.capacityScore);
    profile.costPerUnit = number<double>(node, "cost_per_unit", profile.costPerUnit);
    profile.avgLatencyMs = number<double>(node, "avg_latency_ms", profile.avgLatencyMs);
    profile.successRate = number<double>(node, "success_rate", profile.successRate);
    profile.active = number<bool>(node, "active", profile.active);
    profile.timeout = std::chrono::milliseconds(number<std::int64_t>(node, "timeout_ms", profile.timeout.count()));
    profile.auth = enumeration(node, "auth", AuthStrategy::BearerAuthorization, parseAuthStrategy);
    profile.apiKeyEnv = scalar(node, "api_key_env");
    return profile;
}

PlanRecord parsePlan(const YAML::Node &node) {
    PlanRecord plan;
    plan.id = scalar(node, "id");
    plan.priorityScore = number<int>(node, "priority_score", plan.priorityScore);
    plan.requestsPerDay = number<std::int64_t>(node, "requests_per_day", plan.requestsPerDay);
    plan.rateLimitQps = number<std::int64_t>(node, "rate_limit_qps", plan.rateLimitQps);

    if (const auto access = node["model_access"]; access && access.IsSequence()) {
        for (const auto &entry : access) {
            ModelAccess model;
            model.backend = scalar(entry, "backend");
            model.costWeight = number<double>(entry, "cost_weight", PlanRecord::kDefaultCostWeight);
            model.allowed = number<bool>(entry, "allowed", true);
            plan.modelAccess.push_back(std::move(model));
        }
    }

    if (const auto smart = node["smart_routing"]; smart && smart.IsMap()) {
        auto &config = plan.smartRouting;
        config.defaultMode = scalar(smart, "default_mode");
        config.enableSessionContinuity = number<bool>(smart, "enable_session_continuity", config.enableSessionContinuity);
        config.sessionTtl = std::chrono::seconds(number<std::int64_t>(smart, "session_ttl_seconds", config.sessionTtl.count()));
        config.enableComplexityDetection =
            number<bool>(smart, "enable_task_complexity_detection", config.enableComplexityDetection);
        config.correlationThreshold = number<double>(smart, "correlation_threshold", config.correlationThreshold);
        config.monthlyBudgetLimit = number<double>(smart, "monthly_budget_limit", config.monthlyBudgetLimit);
    }
    return plan;
}

SubscriptionRecord parseSubscription(const YAML::Node &node) {
    SubscriptionRecord record;
    record.id = scalar(node, "id");
    record.customer = scalar(node, "customer");
    record.planId = scalar(node, "plan");
    record.status = enumeration(node, "status", SubscriptionStatus::Active, parseSubscriptionStatus);
    record.priorityScore = number<int>(node, "priority_score", record.priorityScore);
    record.dailyQuotaRemaining = number<std::int64_t>(node, "daily_quota_remaining", record.dailyQuotaRemaining);
    return record;
}

ApiKeyRecord parseApiKey(const YAML::Node &node) {
    ApiKeyRecord record;
    const auto rawKey = scalar(node, "key");
    if (!rawKey.empty()) {
        record.keyHash = hashApiKey(rawKey);
        record.keyPrefix = rawKey.substr(0, std::min<std::size_t>(rawKey.size(), 8));
    } else {
        record.keyHash = scalar(node, "key_hash");
        std::transform(record.keyHash.begin(), record.keyHash.end(), record.keyHash.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        record.keyPrefix = scalar(node, "key_prefix");
    }
    record.subscriptionId = scalar(node, "subscription");
    record.status = enumeration(node, "status", ApiKeyStatus::Active, parseApiKeyStatus);
    return record;
}

template <typename Parser, typename Sink>
void forEachEntry(const YAML::Node &catalog, const char *section, Parser parser, Sink sink) {
    const auto entries = catalog[section];
    if (!entries) {
        return;
    }
    if (!entries.IsSequence()) {
        throw std::invalid_argument(std::string("catalog section '") + section + "' must be a list");
    }
    for (const auto &entry : entries) {
        sink(parser(entry));
    }
}

}  // namespace

void InMemoryStore::putApiKey(ApiKeyRecord record) {
    record.validate();
    std::unique_lock lock(mutex_);
    const auto hash = record.keyHash;
    apiKeys_[hash] = std::move(record);
}

void InMemoryStore::putSubscription(SubscriptionRecord record) {
    record.validate();
    std::unique_lock lock(mutex_);
    const auto id = record.id;
    subscriptions_[id] = std::move(record);
}

void InMemoryStore::putPlan(PlanRecord record) {
    record.validate();
    std::unique_lock lock(mutex_);
    const auto id = record.id;
    plans_[id] = std::move(record);
}

void InMemoryStore::putBackend(BackendProfile profile) {
    profile.validate();
    std::unique_lock lock(mutex_);
    auto it = std::find_if(backends_.begin(), backends_.end(), [&](const BackendProfile &existing) {
        return existing.name == profile.name;
    });
    if (it != backends_.end()) {
        *it = std::move(profile);
    } else {
        backends_.push_back(std::move(profile));
    }
}

std::optional<ApiKeyRecord> InMemoryStore::findApiKey(const std::string &keyHash) const {
    std::shared_lock lock(mutex_);
    auto it = apiKeys_.find(keyHash);
    if (it == apiKeys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SubscriptionRecord> InMemoryStore::findSubscription(const std::string &id) const {
    std::shared_lock lock(mutex_);
    auto it = subscriptions_.find(id);
    if (it == subscriptions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PlanRecord> InMemoryStore::findPlan(const std::string &id) const {
    std::shared_lock lock(mutex_);
    auto it = plans_.find(id);
    if (it == plans_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<BackendProfile> InMemoryStore::findBackend(const std::string &name) const {
    std::shared_lock lock(mutex_);
    for (const auto &profile : backends_) {
        if (profile.name == name) {
            return profile;
        }
    }
    return std::nullopt;
}

std::vector<BackendProfile> InMemoryStore::listBackends() const {
    std::shared_lock lock(mutex_);
    return backends_;
}

bool InMemoryStore::updateBackend(const std::string &name, const BackendMutator &mutator) {
    std::unique_lock lock(mutex_);
    for (auto &profile : backends_) {
        if (profile.name == name) {
            mutator(profile);
            return true;
        }
    }
    return false;
}

bool InMemoryStore::recordQuotaRemaining(const std::string &subscriptionId, std::int64_t remaining) {
    std::unique_lock lock(mutex_);
    auto it = subscriptions_.find(subscriptionId);
    if (it == subscriptions_.end()) {
        return false;
    }
    it->second.dailyQuotaRemaining = remaining;
    return true;
}

bool InMemoryStore::updateHealth(const std::string &name, HealthState health, std::optional<double> latencyMs) {
    return updateBackend(name, [&](BackendProfile &profile) {
        profile.health = health;
        if (latencyMs.has_value()) {
            profile.avgLatencyMs = *latencyMs;
        }
    });
}

void loadCatalog(const YAML::Node &catalog, InMemoryStore &store) {
    if (!catalog) {
        return;
    }
    forEachEntry(catalog, "backends", parseBackend, [&](BackendProfile profile) { store.putBackend(std::move(profile)); });
    forEachEntry(catalog, "plans", parsePlan, [&](PlanRecord plan) { store.putPlan(std::move(plan)); });
    forEachEntry(catalog, "subscriptions", parseSubscription, [&](SubscriptionRecord record) {
        store.putSubscription(std::move(record));
    });
    forEachEntry(catalog, "api_keys", parseApiKey, [&](ApiKeyRecord record) { store.putApiKey(std::move(record)); });
}

}  // namespace llmgate::store
