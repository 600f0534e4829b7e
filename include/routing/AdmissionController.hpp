#pragma once

#include "cache/SharedCache.hpp"
#include "core/UtcCalendar.hpp"
#include "routing/SubscriptionContext.hpp"
#include "store/DurableStore.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace llmgate::routing {

enum class AdmissionDecision {
    Allowed,
    QuotaExceeded,
    RateLimited,
};

std::string_view toString(AdmissionDecision decision);

struct AdmissionResult {
    AdmissionDecision decision{AdmissionDecision::Allowed};
    // Today's remaining quota after this request; -1 for unlimited plans.
    std::int64_t quotaRemaining{-1};
    std::chrono::milliseconds retryAfter{0};

    [[nodiscard]] bool allowed() const { return decision == AdmissionDecision::Allowed; }
};

// Daily quota counter and rolling one-second rate window, both kept in the shared cache so every gateway
// instance sees the same counts. Quota is consumed first and refunded if the rate gate then rejects.
class AdmissionController {
   public:
    using Clock = std::function<core::SystemClock::time_point()>;

    AdmissionController(cache::SharedCache &cache, store::DurableStore &store);
    AdmissionController(cache::SharedCache &cache,
                        store::DurableStore &store,
                        Clock clock,
                        std::chrono::milliseconds rateWindow = std::chrono::seconds(1));

    AdmissionResult admit(const SubscriptionContext &subscription, std::int64_t costUnits);

    [[nodiscard]] std::string quotaKey(const std::string &subscriptionId) const;
    [[nodiscard]] static std::string rateKey(const std::string &subscriptionId);

   private:
    AdmissionResult checkQuota(const SubscriptionContext &subscription, std::int64_t costUnits, const std::string &key);
    bool checkRate(const SubscriptionContext &subscription);
    void refundQuota(const std::string &key, std::int64_t costUnits);
    void recordRemaining(const std::string &subscriptionId, std::int64_t remaining);

    cache::SharedCache &cache_;
    store::DurableStore &store_;
    Clock clock_;
    std::chrono::milliseconds rateWindow_;
};

}  // namespace llmgate::routing
