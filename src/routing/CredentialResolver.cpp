#include "routing/CredentialResolver.hpp"

#include "llmgate/logging.h"

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <memory>

namespace llmgate::routing {
namespace {

std::string serialize(const Json::Value &value) {
    Json::StreamWriterBuilder writerBuilder;
    writerBuilder["indentation"] = "";
    return Json::writeString(writerBuilder, value);
}

std::optional<Json::Value> parse(const std::string &text) {
    Json::Value value;
    std::string errs;
    auto reader = std::unique_ptr<Json::CharReader>(Json::CharReaderBuilder().newCharReader());
    if (!reader->parse(text.c_str(), text.c_str() + text.size(), &value, &errs)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

CredentialResolver::CredentialResolver(cache::SharedCache &cache,
                                       const store::DurableStore &store,
                                       CredentialResolverConfig config)
    : cache_(cache), store_(store), config_(config) {}

std::optional<SubscriptionContext> CredentialResolver::resolve(const std::string &apiKey) {
    if (apiKey.empty()) {
        return std::nullopt;
    }

    const auto keyHash = store::hashApiKey(apiKey);
    const auto key = cacheKey(apiKey);

    if (auto cached = readCache(key, keyHash)) {
        return cached;
    }

    auto context = loadFromStore(apiKey, keyHash);
    if (context.has_value()) {
        writeCache(key, keyHash, *context);
    }
    return context;
}

void CredentialResolver::invalidate(const std::string &apiKey) {
    try {
        cache_.erase(cacheKey(apiKey));
    } catch (const std::exception &ex) {
        LOG_WARN << "Credential cache invalidation failed: " << ex.what();
    }
}

std::string CredentialResolver::cacheKey(const std::string &apiKey) const {
    return "api_key:" + apiKey.substr(0, std::min(apiKey.size(), config_.cachePrefixLength));
}

std::optional<SubscriptionContext> CredentialResolver::readCache(const std::string &key, const std::string &keyHash) {
    std::optional<std::string> raw;
    try {
        raw = cache_.get(key);
    } catch (const std::exception &ex) {
        LOG_WARN << "Credential cache read failed, falling back to store: " << ex.what();
        return std::nullopt;
    }
    if (!raw.has_value()) {
        return std::nullopt;
    }

    const auto entry = parse(*raw);
    if (!entry.has_value() || !entry->isObject() || !(*entry)["key_hash"].isString() ||
        (*entry)["key_hash"].asString() != keyHash) {
        return std::nullopt;
    }
    auto context = SubscriptionContext::fromJson((*entry)["context"]);
    if (!context.has_value() || !store::isAdmitting(context->status)) {
        return std::nullopt;
    }
    return context;
}

void CredentialResolver::writeCache(const std::string &key,
                                    const std::string &keyHash,
                                    const SubscriptionContext &context) {
    Json::Value entry(Json::objectValue);
    entry["key_hash"] = keyHash;
    entry["context"] = context.toJson();
    try {
        cache_.set(key, serialize(entry), config_.cacheTtl);
    } catch (const std::exception &ex) {
        LOG_WARN << "Credential cache write failed: " << ex.what();
    }
}

std::optional<SubscriptionContext> CredentialResolver::loadFromStore(const std::string &apiKey,
                                                                     const std::string &keyHash) const {
    const auto masked = maskApiKey(apiKey);

    const auto record = store_.findApiKey(keyHash);
    if (!record.has_value()) {
        LOG_DEBUG << "Unknown API key " << masked;
        return std::nullopt;
    }
    if (record->status != store::ApiKeyStatus::Active) {
        LOG_INFO << "Revoked API key presented: " << masked;
        return std::nullopt;
    }

    const auto subscription = store_.findSubscription(record->subscriptionId);
    if (!subscription.has_value()) {
        LOG_WARN << "API key " << masked << " references missing subscription " << record->subscriptionId;
        return std::nullopt;
    }
    if (!store::isAdmitting(subscription->status)) {
        LOG_INFO << "Subscription " << subscription->id << " is " << std::string(store::toString(subscription->status))
                 << "; rejecting key " << masked;
        return std::nullopt;
    }

    const auto plan = store_.findPlan(subscription->planId);
    if (!plan.has_value()) {
        LOG_WARN << "Subscription " << subscription->id << " references missing plan " << subscription->planId;
        return std::nullopt;
    }

    return buildSubscriptionContext(*subscription, *plan, masked);
}

}  // namespace llmgate::routing
