#include "routing/AdmissionController.hpp"

#include <trantor/utils/Logger.h>

#include <stdexcept>

namespace llmgate::routing {

std::string_view toString(AdmissionDecision decision) {
    switch (decision) {
        case AdmissionDecision::Allowed:
            return "allowed";
        case AdmissionDecision::QuotaExceeded:
            return "quota_exceeded";
        case AdmissionDecision::RateLimited:
            return "rate_limited";
    }
    return "allowed";
}

AdmissionController::AdmissionController(cache::SharedCache &cache, store::DurableStore &store)
    : AdmissionController(cache, store, [] { return core::SystemClock::now(); }) {}

AdmissionController::AdmissionController(cache::SharedCache &cache,
                                         store::DurableStore &store,
                                         Clock clock,
                                         std::chrono::milliseconds rateWindow)
    : cache_(cache), store_(store), clock_(std::move(clock)), rateWindow_(rateWindow) {
    if (!clock_) {
        throw std::invalid_argument("AdmissionController requires a clock");
    }
    if (rateWindow_.count() <= 0) {
        throw std::invalid_argument("rate window must be positive");
    }
}

AdmissionResult AdmissionController::admit(const SubscriptionContext &subscription, std::int64_t costUnits) {
    if (costUnits <= 0) {
        throw std::invalid_argument("cost units must be positive");
    }

    AdmissionResult result;
    std::string key;
    if (!subscription.unlimited()) {
        key = quotaKey(subscription.subscriptionId);
        result = checkQuota(subscription, costUnits, key);
        if (!result.allowed()) {
            return result;
        }
    }

    if (subscription.rateLimited() && !checkRate(subscription)) {
        if (!key.empty()) {
            refundQuota(key, costUnits);
        }
        result.decision = AdmissionDecision::RateLimited;
        result.retryAfter = rateWindow_;
        if (result.quotaRemaining >= 0) {
            result.quotaRemaining += costUnits;
        }
        return result;
    }

    if (!key.empty()) {
        recordRemaining(subscription.subscriptionId, result.quotaRemaining);
    }
    return result;
}

std::string AdmissionController::quotaKey(const std::string &subscriptionId) const {
    return "quota:" + subscriptionId + ":" + core::utcDate(clock_());
}

std::string AdmissionController::rateKey(const std::string &subscriptionId) {
    return "ratelimit:" + subscriptionId;
}

AdmissionResult AdmissionController::checkQuota(const SubscriptionContext &subscription,
                                                std::int64_t costUnits,
                                                const std::string &key) {
    // Two passes cover a counter that expires between initialization and the decrement.
    for (int pass = 0; pass < 2; ++pass) {
        const auto ttl = core::secondsUntilUtcMidnight(clock_());
        if (cache_.setIfAbsent(key, std::to_string(subscription.dailyQuotaLimit), ttl)) {
            LOG_DEBUG << "Daily quota counter started for " << subscription.subscriptionId;
            recordRemaining(subscription.subscriptionId, subscription.dailyQuotaLimit);
        }

        const auto step = cache_.decrementWithFloor(key, costUnits, 0);
        switch (step.status) {
            case cache::DecrementStatus::Applied:
                return AdmissionResult{AdmissionDecision::Allowed, step.value, std::chrono::milliseconds(0)};
            case cache::DecrementStatus::Insufficient:
                return AdmissionResult{AdmissionDecision::QuotaExceeded, step.value, std::chrono::milliseconds(0)};
            case cache::DecrementStatus::Missing:
                break;
        }
    }
    throw std::runtime_error("quota counter for " + subscription.subscriptionId + " could not be initialized");
}

bool AdmissionController::checkRate(const SubscriptionContext &subscription) {
    return cache_.takeToken(rateKey(subscription.subscriptionId), subscription.rateLimitQps, rateWindow_);
}

void AdmissionController::refundQuota(const std::string &key, std::int64_t costUnits) {
    try {
        cache_.incrementBy(key, costUnits, core::secondsUntilUtcMidnight(clock_()));
    } catch (const std::exception &ex) {
        LOG_WARN << "Quota refund for " << key << " failed: " << ex.what();
    }
}

void AdmissionController::recordRemaining(const std::string &subscriptionId, std::int64_t remaining) {
    try {
        if (!store_.recordQuotaRemaining(subscriptionId, remaining)) {
            LOG_WARN << "Quota write-back skipped; subscription " << subscriptionId << " not found";
        }
    } catch (const std::exception &ex) {
        LOG_WARN << "Quota write-back for " << subscriptionId << " failed: " << ex.what();
    }
}

}  // namespace llmgate::routing
