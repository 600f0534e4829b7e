#pragma once

#include "cache/SharedCache.hpp"
#include "routing/SubscriptionContext.hpp"
#include "store/DurableStore.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace llmgate::routing {

struct CredentialResolverConfig {
    std::chrono::seconds cacheTtl{60};
    std::size_t cachePrefixLength{16};
};

// Turns a presented API key into a SubscriptionContext. Cache entries are keyed by a prefix of the
// key and carry the full key hash, so a prefix collision never yields another caller's context.
class CredentialResolver {
   public:
    CredentialResolver(cache::SharedCache &cache, const store::DurableStore &store, CredentialResolverConfig config = {});

    std::optional<SubscriptionContext> resolve(const std::string &apiKey);

    // Drops the cached context so the next request rebuilds it from the store (plan change, revocation).
    void invalidate(const std::string &apiKey);

    [[nodiscard]] std::string cacheKey(const std::string &apiKey) const;

   private:
    std::optional<SubscriptionContext> readCache(const std::string &key, const std::string &keyHash);
    void writeCache(const std::string &key, const std::string &keyHash, const SubscriptionContext &context);
    std::optional<SubscriptionContext> loadFromStore(const std::string &apiKey, const std::string &keyHash) const;

    cache::SharedCache &cache_;
    const store::DurableStore &store_;
    CredentialResolverConfig config_;
};

}  // namespace llmgate::routing
