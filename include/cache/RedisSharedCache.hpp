#pragma once

#include "cache/SharedCache.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace sw::redis {
class Redis;
}  // namespace sw::redis

namespace llmgate::cache {

struct RedisCacheConfig {
    std::string url{"redis://127.0.0.1:6379"};
    std::chrono::milliseconds connectTimeout{1500};
    std::chrono::milliseconds socketTimeout{1000};
    std::size_t poolSize{8};
};

// SharedCache on a Redis server, so quota, rate, credential and session state is common to every
// gateway instance pointed at the same server. Counter steps run as server-side Lua scripts.
// Connection and reply failures surface as sw::redis::Error (a std::exception).
class RedisSharedCache : public SharedCache {
   public:
    explicit RedisSharedCache(const RedisCacheConfig &config);
    ~RedisSharedCache() override;

    std::optional<std::string> get(const std::string &key) override;
    void set(const std::string &key, const std::string &value, std::chrono::seconds ttl) override;
    bool setIfAbsent(const std::string &key, const std::string &value, std::chrono::seconds ttl) override;
    void erase(const std::string &key) override;

    DecrementResult decrementWithFloor(const std::string &key, std::int64_t amount, std::int64_t floor) override;
    std::int64_t incrementBy(const std::string &key, std::int64_t amount, std::chrono::seconds ttlIfCreated) override;
    bool takeToken(const std::string &key, std::int64_t capacity, std::chrono::milliseconds window) override;

   private:
    std::unique_ptr<sw::redis::Redis> redis_;
};

}  // namespace llmgate::cache
