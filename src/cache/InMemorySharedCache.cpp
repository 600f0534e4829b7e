#include "cache/InMemorySharedCache.hpp"

#include <charconv>
#include <stdexcept>

namespace llmgate::cache {
namespace {

std::int64_t parseCounter(const std::string &key, const std::string &value) {
    std::int64_t parsed = 0;
    const auto *begin = value.data();
    const auto *end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        throw std::invalid_argument("cache value at '" + key + "' is not an integer");
    }
    return parsed;
}

}  // namespace

InMemorySharedCache::InMemorySharedCache() : InMemorySharedCache([] { return std::chrono::steady_clock::now(); }) {}

InMemorySharedCache::InMemorySharedCache(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("InMemorySharedCache requires a clock");
    }
}

std::optional<std::string> InMemorySharedCache::get(const std::string &key) {
    auto &stripe = stripeFor(key);
    std::lock_guard guard(stripe.mutex);
    if (auto *entry = findLive(stripe, key, clock_())) {
        return entry->value;
    }
    return std::nullopt;
}

void InMemorySharedCache::set(const std::string &key, const std::string &value, std::chrono::seconds ttl) {
    auto &stripe = stripeFor(key);
    std::lock_guard guard(stripe.mutex);
    stripe.entries[key] = Entry{value, expiry(clock_(), ttl)};
}

bool InMemorySharedCache::setIfAbsent(const std::string &key, const std::string &value, std::chrono::seconds ttl) {
    auto &stripe = stripeFor(key);
    std::lock_guard guard(stripe.mutex);
    const auto now = clock_();
    if (findLive(stripe, key, now) != nullptr) {
        return false;
    }
    stripe.entries[key] = Entry{value, expiry(now, ttl)};
    return true;
}

void InMemorySharedCache::erase(const std::string &key) {
    auto &stripe = stripeFor(key);
    std::lock_guard guard(stripe.mutex);
    stripe.entries.erase(key);
}

DecrementResult InMemorySharedCache::decrementWithFloor(const std::string &key, std::int64_t amount, std::int64_t floor) {
    auto &stripe = stripeFor(key);
    std::lock_guard guard(stripe.mutex);
    auto *entry = findLive(stripe, key, clock_());
    if (entry == nullptr) {
        return DecrementResult{DecrementStatus::Missing, 0};
    }

    const auto current = parseCounter(key, entry->value);
    if (current - amount < floor) {
        return DecrementResult{DecrementStatus::Insufficient, current};
    }
    const auto next = current - amount;
    entry->value = std::to_string(next);
    return DecrementResult{DecrementStatus::Applied, next};
}

std::int64_t InMemorySharedCache::incrementBy(const std::string &key, std::int64_t amount, std::chrono::seconds ttlIfCreated) {
    auto &stripe = stripeFor(key);
    std::lock_guard guard(stripe.mutex);
    const auto now = clock_();
    if (auto *entry = findLive(stripe, key, now)) {
        const auto next = parseCounter(key, entry->value) + amount;
        entry->value = std::to_string(next);
        return next;
    }
    stripe.entries[key] = Entry{std::to_string(amount), expiry(now, ttlIfCreated)};
    return amount;
}

bool InMemorySharedCache::takeToken(const std::string &key, std::int64_t capacity, std::chrono::milliseconds window) {
    if (capacity <= 0) {
        throw std::invalid_argument("rate window capacity must be positive");
    }
    if (window.count() <= 0) {
        throw std::invalid_argument("rate window length must be positive");
    }

    auto &stripe = stripeFor(key);
    std::lock_guard guard(stripe.mutex);
    const auto now = clock_();
    auto &log = stripe.takeLogs[key];
    log.window = window;
    while (!log.takes.empty() && log.takes.front() <= now - window) {
        log.takes.pop_front();
    }
    if (static_cast<std::int64_t>(log.takes.size()) >= capacity) {
        return false;
    }
    log.takes.push_back(now);
    return true;
}

std::size_t InMemorySharedCache::purgeExpired() {
    const auto now = clock_();
    std::size_t removed = 0;
    for (auto &stripe : stripes_) {
        std::lock_guard guard(stripe.mutex);
        for (auto it = stripe.entries.begin(); it != stripe.entries.end();) {
            const auto &expiresAt = it->second.expiresAt;
            if (expiresAt != std::chrono::steady_clock::time_point{} && now >= expiresAt) {
                it = stripe.entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        for (auto it = stripe.takeLogs.begin(); it != stripe.takeLogs.end();) {
            auto &takes = it->second.takes;
            while (!takes.empty() && takes.front() <= now - it->second.window) {
                takes.pop_front();
            }
            if (takes.empty()) {
                it = stripe.takeLogs.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

InMemorySharedCache::Stripe &InMemorySharedCache::stripeFor(const std::string &key) {
    return stripes_[std::hash<std::string>{}(key) % kStripeCount];
}

InMemorySharedCache::Entry *InMemorySharedCache::findLive(Stripe &stripe,
                                                          const std::string &key,
                                                          std::chrono::steady_clock::time_point now) {
    auto it = stripe.entries.find(key);
    if (it == stripe.entries.end()) {
        return nullptr;
    }
    const auto &expiresAt = it->second.expiresAt;
    if (expiresAt != std::chrono::steady_clock::time_point{} && now >= expiresAt) {
        stripe.entries.erase(it);
        return nullptr;
    }
    return &it->second;
}

// A zero ttl keeps the entry until it is erased or overwritten.
std::chrono::steady_clock::time_point InMemorySharedCache::expiry(std::chrono::steady_clock::time_point now,
                                                                  std::chrono::milliseconds ttl) const {
    if (ttl.count() <= 0) {
        return {};
    }
    return now + ttl;
}

}  // namespace llmgate::cache
