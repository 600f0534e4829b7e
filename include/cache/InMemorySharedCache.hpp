#pragma once

#include "cache/SharedCache.hpp"

#include <array>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace llmgate::cache {

class InMemorySharedCache : public SharedCache {
   public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    InMemorySharedCache();
    explicit InMemorySharedCache(Clock clock);

    std::optional<std::string> get(const std::string &key) override;
    void set(const std::string &key, const std::string &value, std::chrono::seconds ttl) override;
    bool setIfAbsent(const std::string &key, const std::string &value, std::chrono::seconds ttl) override;
    void erase(const std::string &key) override;

    DecrementResult decrementWithFloor(const std::string &key, std::int64_t amount, std::int64_t floor) override;
    std::int64_t incrementBy(const std::string &key, std::int64_t amount, std::chrono::seconds ttlIfCreated) override;
    bool takeToken(const std::string &key, std::int64_t capacity, std::chrono::milliseconds window) override;

    // Drops expired entries; lookups already ignore them, this only reclaims memory.
    std::size_t purgeExpired();

   private:
    static constexpr std::size_t kStripeCount = 16;

    struct Entry {
        std::string value;
        std::chrono::steady_clock::time_point expiresAt{};
    };

    struct TakeLog {
        std::deque<std::chrono::steady_clock::time_point> takes;
        std::chrono::milliseconds window{0};
    };

    struct Stripe {
        std::mutex mutex;
        std::unordered_map<std::string, Entry> entries;
        std::unordered_map<std::string, TakeLog> takeLogs;
    };

    Stripe &stripeFor(const std::string &key);
    Entry *findLive(Stripe &stripe, const std::string &key, std::chrono::steady_clock::time_point now);
    std::chrono::steady_clock::time_point expiry(std::chrono::steady_clock::time_point now,
                                                 std::chrono::milliseconds ttl) const;

    Clock clock_;
    std::array<Stripe, kStripeCount> stripes_;
};

}  // namespace llmgate::cache
