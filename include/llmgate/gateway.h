#pragma once

#include "cache/InMemorySharedCache.hpp"
#include "cache/RedisSharedCache.hpp"
#include "providers/HealthChecker.hpp"
#include "providers/HttpBackendClient.hpp"
#include "routing/AdmissionController.hpp"
#include "routing/BackendStats.hpp"
#include "routing/BudgetTracker.hpp"
#include "routing/CredentialResolver.hpp"
#include "routing/ModeProfiles.hpp"
#include "routing/ModelScorer.hpp"
#include "routing/Router.hpp"
#include "routing/SessionAffinity.hpp"
#include "routing/TaskClassifier.hpp"
#include "routing/UsageLog.hpp"
#include "store/InMemoryStore.hpp"

#include <trantor/utils/ConcurrentTaskQueue.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace YAML {
class Node;
}  // namespace YAML

namespace llmgate {

enum class CacheBackend {
    Memory,
    Redis,
};

struct SharedCacheSettings {
    // Memory keeps every counter inside this process; only suitable for a single instance.
    CacheBackend backend{CacheBackend::Memory};
    cache::RedisCacheConfig redis;
};

struct GatewaySettings {
    routing::ScoringWeights weights;
    SharedCacheSettings cache;
    routing::CredentialResolverConfig credentials;
    routing::ModeProfiles modes{routing::ModeProfiles::defaults()};
    providers::HttpClientConfig http;
    std::filesystem::path usageLogPath{"logs/usage.jsonl"};
    std::size_t usageQueueCapacity{10000};
    std::chrono::seconds healthCheckInterval{300};
    std::chrono::milliseconds healthCheckTimeout{5000};
    std::chrono::seconds cachePurgeInterval{60};
    std::size_t routeWorkers{16};
};

// Reads gateway.yaml (everything except the catalog). Throws std::invalid_argument on bad values.
GatewaySettings loadGatewaySettings(const YAML::Node &gatewayConfig, bool dryRun);

// Owns one instance of every routing collaborator, wired together from gateway.yaml.
class Gateway {
   public:
    Gateway(const YAML::Node &gatewayConfig, bool dryRun);
    ~Gateway();

    Gateway(const Gateway &) = delete;
    Gateway &operator=(const Gateway &) = delete;

    routing::Router &router() { return *router_; }
    providers::BackendHealthChecker &healthChecker() { return *healthChecker_; }
    cache::SharedCache &cache() { return *cache_; }
    store::InMemoryStore &store() { return *store_; }
    const GatewaySettings &settings() const { return settings_; }

    // Runs a routing task off the I/O loops; backend calls block for up to their timeout.
    void dispatch(std::function<void()> task);

    // Reclaims expired entries of the in-process cache. Redis expires keys itself.
    std::size_t purgeExpiredCache();

    // Stops the route workers, flushes pending usage records and stops the usage worker.
    void shutdown();

   private:
    GatewaySettings settings_;
    std::unique_ptr<cache::SharedCache> cache_;
    cache::InMemorySharedCache *memoryCache_{nullptr};
    std::unique_ptr<store::InMemoryStore> store_;
    std::unique_ptr<routing::CredentialResolver> resolver_;
    std::unique_ptr<routing::AdmissionController> admission_;
    std::unique_ptr<routing::ModelScorer> scorer_;
    std::unique_ptr<routing::TaskClassifier> classifier_;
    std::unique_ptr<routing::SessionAffinity> affinity_;
    std::unique_ptr<providers::HttpBackendClient> client_;
    std::unique_ptr<routing::StoreBackendStatsRecorder> stats_;
    std::unique_ptr<routing::AsyncUsageLog> usage_;
    std::unique_ptr<routing::LoggingBudgetNotifier> notifier_;
    std::unique_ptr<routing::BudgetTracker> budget_;
    std::unique_ptr<routing::Router> router_;
    std::unique_ptr<providers::CprHealthProbe> probe_;
    std::unique_ptr<providers::BackendHealthChecker> healthChecker_;
    std::unique_ptr<trantor::ConcurrentTaskQueue> routeQueue_;
};

}  // namespace llmgate
