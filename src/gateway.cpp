#include "llmgate/gateway.h"

#include "llmgate/environment.h"

#include <trantor/utils/Logger.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace llmgate {

namespace {

std::string resolveScalar(const YAML::Node &node) {
    if (!node || !node.IsScalar()) {
        return {};
    }
    return expandEnvPlaceholder(node.as<std::string>(""));
}

std::unordered_map<std::string, std::string> parseHeaders(const YAML::Node &node) {
    std::unordered_map<std::string, std::string> headers;
    if (!node || !node.IsMap()) {
        return headers;
    }
    for (const auto &entry : node) {
        auto key = entry.first.as<std::string>("");
        auto value = resolveScalar(entry.second);
        if (!key.empty()) {
            headers.emplace(std::move(key), std::move(value));
        }
    }
    return headers;
}

long long parseInteger(const YAML::Node &node, const char *name, long long fallback) {
    if (!node) {
        return fallback;
    }
    const auto scalar = resolveScalar(node);
    if (scalar.empty()) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        const auto value = std::stoll(scalar, &consumed);
        if (consumed != scalar.size()) {
            throw std::invalid_argument(scalar);
        }
        return value;
    } catch (const std::exception &) {
        throw std::invalid_argument(std::string("gateway.yaml: ") + name + " must be an integer, got '" + scalar + "'");
    }
}

long long parsePositive(const YAML::Node &node, const char *name, long long fallback) {
    const auto value = parseInteger(node, name, fallback);
    if (value <= 0) {
        throw std::invalid_argument(std::string("gateway.yaml: ") + name + " must be positive");
    }
    return value;
}

YAML::Node child(const YAML::Node &node, const char *key) {
    if (!node || !node.IsMap()) {
        return YAML::Node();
    }
    return node[key];
}

CacheBackend parseCacheBackend(const YAML::Node &node) {
    auto name = resolveScalar(node);
    if (name.empty() || name == "memory") {
        return CacheBackend::Memory;
    }
    if (name == "redis") {
        return CacheBackend::Redis;
    }
    throw std::invalid_argument("gateway.yaml: cache.backend must be 'memory' or 'redis', got '" + name + "'");
}

std::unique_ptr<cache::SharedCache> makeSharedCache(const SharedCacheSettings &settings,
                                                    cache::InMemorySharedCache *&memoryCache) {
    if (settings.backend == CacheBackend::Redis) {
        memoryCache = nullptr;
        return std::make_unique<cache::RedisSharedCache>(settings.redis);
    }
    LOG_WARN << "Shared cache is in-process; quota and rate limits are not shared with other instances";
    auto memory = std::make_unique<cache::InMemorySharedCache>();
    memoryCache = memory.get();
    return memory;
}

}  // namespace

GatewaySettings loadGatewaySettings(const YAML::Node &gatewayConfig, bool dryRun) {
    GatewaySettings settings;

    settings.weights = routing::ScoringWeights::load(child(gatewayConfig, "routing"));
    settings.modes = routing::ModeProfiles::load(child(gatewayConfig, "modes"));

    const auto gateway = child(gatewayConfig, "gateway");

    const auto cacheNode = child(gateway, "cache");
    settings.cache.backend = parseCacheBackend(child(cacheNode, "backend"));
    if (const auto url = resolveScalar(child(cacheNode, "url")); !url.empty()) {
        settings.cache.redis.url = url;
    }
    settings.cache.redis.connectTimeout = std::chrono::milliseconds(parsePositive(
        child(cacheNode, "connect_timeout_ms"), "cache.connect_timeout_ms", settings.cache.redis.connectTimeout.count()));
    settings.cache.redis.socketTimeout = std::chrono::milliseconds(parsePositive(
        child(cacheNode, "socket_timeout_ms"), "cache.socket_timeout_ms", settings.cache.redis.socketTimeout.count()));
    settings.cache.redis.poolSize = static_cast<std::size_t>(parsePositive(
        child(cacheNode, "pool_size"), "cache.pool_size", static_cast<long long>(settings.cache.redis.poolSize)));

    settings.routeWorkers = static_cast<std::size_t>(
        parsePositive(child(gateway, "route_workers"), "route_workers", static_cast<long long>(settings.routeWorkers)));

    const auto credentials = child(gateway, "credential_cache");
    settings.credentials.cacheTtl = std::chrono::seconds(
        parsePositive(child(credentials, "ttl_seconds"), "credential_cache.ttl_seconds", settings.credentials.cacheTtl.count()));
    settings.credentials.cachePrefixLength = static_cast<std::size_t>(parsePositive(
        child(credentials, "prefix_length"), "credential_cache.prefix_length",
        static_cast<long long>(settings.credentials.cachePrefixLength)));

    const auto usage = child(gateway, "usage_log");
    if (const auto path = resolveScalar(child(usage, "path")); !path.empty()) {
        settings.usageLogPath = path;
    }
    settings.usageQueueCapacity = static_cast<std::size_t>(parsePositive(
        child(usage, "queue_capacity"), "usage_log.queue_capacity", static_cast<long long>(settings.usageQueueCapacity)));

    const auto health = child(gateway, "health_check");
    settings.healthCheckInterval = std::chrono::seconds(
        parsePositive(child(health, "interval_seconds"), "health_check.interval_seconds", settings.healthCheckInterval.count()));
    settings.healthCheckTimeout = std::chrono::milliseconds(
        parsePositive(child(health, "timeout_ms"), "health_check.timeout_ms", settings.healthCheckTimeout.count()));

    settings.cachePurgeInterval = std::chrono::seconds(parsePositive(
        child(gateway, "cache_purge_interval_seconds"), "cache_purge_interval_seconds", settings.cachePurgeInterval.count()));

    const auto http = child(gateway, "http_client");
    settings.http.dryRun = dryRun;
    settings.http.defaultHeaders = parseHeaders(child(http, "default_headers"));
    settings.http.connectTimeout = std::chrono::milliseconds(
        parsePositive(child(http, "connect_timeout_ms"), "http_client.connect_timeout_ms", settings.http.connectTimeout.count()));
    settings.http.circuitBreakerThreshold = static_cast<std::size_t>(parsePositive(
        child(http, "circuit_breaker_threshold"), "http_client.circuit_breaker_threshold",
        static_cast<long long>(settings.http.circuitBreakerThreshold)));
    settings.http.circuitBreakerCooldown = std::chrono::milliseconds(parsePositive(
        child(http, "circuit_breaker_cooldown_ms"), "http_client.circuit_breaker_cooldown_ms",
        settings.http.circuitBreakerCooldown.count()));
    if (const auto agent = resolveScalar(child(http, "user_agent")); !agent.empty()) {
        settings.http.userAgent = agent;
    }

    return settings;
}

Gateway::Gateway(const YAML::Node &gatewayConfig, bool dryRun) : settings_(loadGatewaySettings(gatewayConfig, dryRun)) {
    cache_ = makeSharedCache(settings_.cache, memoryCache_);
    store_ = std::make_unique<store::InMemoryStore>();
    store::loadCatalog(child(gatewayConfig, "catalog"), *store_);

    resolver_ = std::make_unique<routing::CredentialResolver>(*cache_, *store_, settings_.credentials);
    admission_ = std::make_unique<routing::AdmissionController>(*cache_, *store_);
    scorer_ = std::make_unique<routing::ModelScorer>(settings_.weights);
    classifier_ = std::make_unique<routing::TaskClassifier>();
    affinity_ = std::make_unique<routing::SessionAffinity>(*cache_);
    client_ = std::make_unique<providers::HttpBackendClient>(settings_.http);
    stats_ = std::make_unique<routing::StoreBackendStatsRecorder>(*store_);

    auto sink = std::make_shared<routing::JsonLinesUsageSink>(settings_.usageLogPath);
    usage_ = std::make_unique<routing::AsyncUsageLog>(std::move(sink), settings_.usageQueueCapacity);

    notifier_ = std::make_unique<routing::LoggingBudgetNotifier>();
    budget_ = std::make_unique<routing::BudgetTracker>(*cache_, *notifier_);

    router_ = std::make_unique<routing::Router>(routing::RouterServices{
        *resolver_,
        *admission_,
        *store_,
        *scorer_,
        *classifier_,
        settings_.modes,
        *affinity_,
        *client_,
        *stats_,
        *usage_,
        budget_.get(),
    });

    probe_ = std::make_unique<providers::CprHealthProbe>();
    healthChecker_ = std::make_unique<providers::BackendHealthChecker>(*store_, *probe_, settings_.healthCheckTimeout);

    routeQueue_ = std::make_unique<trantor::ConcurrentTaskQueue>(settings_.routeWorkers, "RouteWorkers");

    LOG_INFO << "Gateway ready with " << store_->listBackends().size() << " backends; usage log at "
             << settings_.usageLogPath.string();
}

Gateway::~Gateway() {
    shutdown();
}

void Gateway::dispatch(std::function<void()> task) {
    routeQueue_->runTaskInQueue(std::move(task));
}

std::size_t Gateway::purgeExpiredCache() {
    if (memoryCache_ == nullptr) {
        return 0;
    }
    return memoryCache_->purgeExpired();
}

void Gateway::shutdown() {
    if (routeQueue_) {
        routeQueue_->stop();
    }
    if (usage_) {
        usage_->stop();
    }
}

}  // namespace llmgate
