#pragma once

#include "store/Records.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace llmgate::store {

// Source of truth for keys, subscriptions, plans and backend profiles. The router only reads it on
// cache misses; backend statistics, health and quota rollovers are written back best-effort.
class DurableStore {
   public:
    using BackendMutator = std::function<void(BackendProfile &)>;

    virtual ~DurableStore() = default;

    virtual std::optional<ApiKeyRecord> findApiKey(const std::string &keyHash) const = 0;
    virtual std::optional<SubscriptionRecord> findSubscription(const std::string &id) const = 0;
    virtual std::optional<PlanRecord> findPlan(const std::string &id) const = 0;
    virtual std::optional<BackendProfile> findBackend(const std::string &name) const = 0;
    virtual std::vector<BackendProfile> listBackends() const = 0;

    // Applies `mutator` under the store's own locking; returns false when the backend is unknown.
    virtual bool updateBackend(const std::string &name, const BackendMutator &mutator) = 0;
    virtual bool recordQuotaRemaining(const std::string &subscriptionId, std::int64_t remaining) = 0;
    virtual bool updateHealth(const std::string &name, HealthState health, std::optional<double> latencyMs) = 0;
};

}  // namespace llmgate::store
