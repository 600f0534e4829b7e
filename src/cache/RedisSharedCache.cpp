#include "cache/RedisSharedCache.hpp"

#include <drogon/utils/Utilities.h>
#include <sw/redis++/redis++.h>
#include <trantor/utils/Logger.h>

#include <iterator>
#include <stdexcept>
#include <vector>

namespace llmgate::cache {
namespace {

// Reply: {status, value} with status 0 = applied, 1 = insufficient, 2 = missing.
constexpr const char *kDecrementWithFloor = R"lua(
local current = redis.call('GET', KEYS[1])
if not current then
    return {2, 0}
end
local value = tonumber(current)
if value == nil or value ~= math.floor(value) then
    return redis.error_reply('cache value at ' .. KEYS[1] .. ' is not an integer')
end
local amount = tonumber(ARGV[1])
if value - amount < tonumber(ARGV[2]) then
    return {1, value}
end
return {0, redis.call('DECRBY', KEYS[1], amount)}
)lua";

constexpr const char *kIncrementBy = R"lua(
local existed = redis.call('EXISTS', KEYS[1])
local value = redis.call('INCRBY', KEYS[1], ARGV[1])
if existed == 0 and tonumber(ARGV[2]) > 0 then
    redis.call('EXPIRE', KEYS[1], ARGV[2])
end
return value
)lua";

// Sliding log in a sorted set scored by the server clock in milliseconds.
constexpr const char *kTakeToken = R"lua(
local capacity = tonumber(ARGV[1])
local window = tonumber(ARGV[2])
local time = redis.call('TIME')
local now = tonumber(time[1]) * 1000 + math.floor(tonumber(time[2]) / 1000)
redis.call('ZREMRANGEBYSCORE', KEYS[1], '-inf', now - window)
if redis.call('ZCARD', KEYS[1]) >= capacity then
    return 0
end
redis.call('ZADD', KEYS[1], now, ARGV[3])
redis.call('PEXPIRE', KEYS[1], window)
return 1
)lua";

DecrementStatus decrementStatus(long long code) {
    switch (code) {
        case 0:
            return DecrementStatus::Applied;
        case 1:
            return DecrementStatus::Insufficient;
        default:
            return DecrementStatus::Missing;
    }
}

}  // namespace

RedisSharedCache::RedisSharedCache(const RedisCacheConfig &config) {
    if (config.url.empty()) {
        throw std::invalid_argument("redis cache requires a url");
    }
    if (config.poolSize == 0) {
        throw std::invalid_argument("redis cache pool size must be positive");
    }

    sw::redis::ConnectionOptions connection(config.url);
    connection.connect_timeout = config.connectTimeout;
    connection.socket_timeout = config.socketTimeout;

    sw::redis::ConnectionPoolOptions pool;
    pool.size = config.poolSize;

    redis_ = std::make_unique<sw::redis::Redis>(connection, pool);
    LOG_INFO << "Shared cache uses redis at " << connection.host << ':' << connection.port;
}

RedisSharedCache::~RedisSharedCache() = default;

std::optional<std::string> RedisSharedCache::get(const std::string &key) {
    auto value = redis_->get(key);
    if (!value) {
        return std::nullopt;
    }
    return std::string(*value);
}

void RedisSharedCache::set(const std::string &key, const std::string &value, std::chrono::seconds ttl) {
    redis_->set(key, value, std::chrono::milliseconds(ttl));
}

bool RedisSharedCache::setIfAbsent(const std::string &key, const std::string &value, std::chrono::seconds ttl) {
    return redis_->set(key, value, std::chrono::milliseconds(ttl), sw::redis::UpdateType::NOT_EXIST);
}

void RedisSharedCache::erase(const std::string &key) {
    redis_->del(key);
}

DecrementResult RedisSharedCache::decrementWithFloor(const std::string &key, std::int64_t amount, std::int64_t floor) {
    std::vector<long long> reply;
    redis_->eval(kDecrementWithFloor, {key}, {std::to_string(amount), std::to_string(floor)}, std::back_inserter(reply));
    if (reply.size() != 2) {
        throw std::runtime_error("unexpected reply from decrement script for '" + key + "'");
    }
    return DecrementResult{decrementStatus(reply[0]), static_cast<std::int64_t>(reply[1])};
}

std::int64_t RedisSharedCache::incrementBy(const std::string &key, std::int64_t amount, std::chrono::seconds ttlIfCreated) {
    return redis_->eval<long long>(kIncrementBy, {key}, {std::to_string(amount), std::to_string(ttlIfCreated.count())});
}

bool RedisSharedCache::takeToken(const std::string &key, std::int64_t capacity, std::chrono::milliseconds window) {
    if (capacity <= 0) {
        throw std::invalid_argument("rate window capacity must be positive");
    }
    if (window.count() <= 0) {
        throw std::invalid_argument("rate window length must be positive");
    }
    const auto member = drogon::utils::getUuid();
    const auto taken = redis_->eval<long long>(
        kTakeToken, {key}, {std::to_string(capacity), std::to_string(window.count()), member});
    return taken == 1;
}

}  // namespace llmgate::cache
