#pragma once

#include "store/DurableStore.hpp"

#include <map>
#include <shared_mutex>

namespace YAML {
class Node;
}  // namespace YAML

namespace llmgate::store {

class InMemoryStore : public DurableStore {
   public:
    InMemoryStore() = default;

    // Each put validates the record and throws std::invalid_argument when it is malformed.
    void putApiKey(ApiKeyRecord record);
    void putSubscription(SubscriptionRecord record);
    void putPlan(PlanRecord record);
    void putBackend(BackendProfile profile);

    std::optional<ApiKeyRecord> findApiKey(const std::string &keyHash) const override;
    std::optional<SubscriptionRecord> findSubscription(const std::string &id) const override;
    std::optional<PlanRecord> findPlan(const std::string &id) const override;
    std::optional<BackendProfile> findBackend(const std::string &name) const override;
    std::vector<BackendProfile> listBackends() const override;

    bool updateBackend(const std::string &name, const BackendMutator &mutator) override;
    bool recordQuotaRemaining(const std::string &subscriptionId, std::int64_t remaining) override;
    bool updateHealth(const std::string &name, HealthState health, std::optional<double> latencyMs) override;

   private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, ApiKeyRecord> apiKeys_;
    std::map<std::string, SubscriptionRecord> subscriptions_;
    std::map<std::string, PlanRecord> plans_;
    std::vector<BackendProfile> backends_;
};

// Populates `store` from the `catalog` section of the gateway configuration. Raw keys listed under
// `api_keys[].key` are hashed on load; `key_hash` may be given instead.
void loadCatalog(const YAML::Node &catalog, InMemoryStore &store);

}  // namespace llmgate::store
