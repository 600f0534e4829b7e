#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace llmgate::cache {

enum class DecrementStatus {
    Applied,
    Insufficient,
    Missing,
};

struct DecrementResult {
    DecrementStatus status{DecrementStatus::Missing};
    // Value after the step when Applied, the untouched value when Insufficient.
    std::int64_t value{0};
};

// Key/value cache shared by every gateway instance. Counter operations are single atomic steps;
// callers never read-then-write a counter.
class SharedCache {
   public:
    virtual ~SharedCache() = default;

    virtual std::optional<std::string> get(const std::string &key) = 0;
    virtual void set(const std::string &key, const std::string &value, std::chrono::seconds ttl) = 0;
    virtual bool setIfAbsent(const std::string &key, const std::string &value, std::chrono::seconds ttl) = 0;
    virtual void erase(const std::string &key) = 0;

    virtual DecrementResult decrementWithFloor(const std::string &key, std::int64_t amount, std::int64_t floor) = 0;
    virtual std::int64_t incrementBy(const std::string &key, std::int64_t amount, std::chrono::seconds ttlIfCreated) = 0;

    // Rolling-window admission: succeeds when fewer than `capacity` tokens were taken from `key`
    // within the last `window`, and records this take. Takes exactly `window` old no longer count.
    virtual bool takeToken(const std::string &key, std::int64_t capacity, std::chrono::milliseconds window) = 0;
};

}  // namespace llmgate::cache
