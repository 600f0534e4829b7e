#include "routing/BudgetTracker.hpp"

#include <trantor/utils/Logger.h>

#include <cmath>
#include <stdexcept>

namespace llmgate::routing {
namespace {

constexpr double kMicroUnits = 1'000'000.0;

}  // namespace

void LoggingBudgetNotifier::notify(const BudgetAlert &alert) {
    LOG_WARN << "Subscription " << alert.subscriptionId << " (" << alert.customer << ") reached "
             << static_cast<int>(std::lround(alert.threshold * 100.0)) << "% of its monthly budget: " << alert.spent
             << " of " << alert.limit;
}

BudgetTracker::BudgetTracker(cache::SharedCache &cache, BudgetNotifier &notifier)
    : BudgetTracker(cache, notifier, [] { return core::SystemClock::now(); }) {}

BudgetTracker::BudgetTracker(cache::SharedCache &cache,
                             BudgetNotifier &notifier,
                             Clock clock,
                             std::vector<double> thresholds)
    : cache_(cache), notifier_(notifier), clock_(std::move(clock)), thresholds_(std::move(thresholds)) {
    if (!clock_) {
        throw std::invalid_argument("BudgetTracker requires a clock");
    }
    for (double threshold : thresholds_) {
        if (threshold <= 0.0) {
            throw std::invalid_argument("budget thresholds must be positive");
        }
    }
}

double BudgetTracker::recordSpend(const SubscriptionContext &subscription, double amount) {
    const auto delta = static_cast<std::int64_t>(std::llround(amount * kMicroUnits));
    const auto now = clock_();
    const auto total =
        cache_.incrementBy(budgetKey(subscription.subscriptionId, now), delta, core::secondsUntilNextUtcMonth(now));
    const auto previous = total - delta;

    const double limit = subscription.smartRouting.monthlyBudgetLimit;
    if (limit > 0.0 && delta > 0) {
        for (double threshold : thresholds_) {
            const auto boundary = static_cast<std::int64_t>(std::llround(limit * threshold * kMicroUnits));
            if (previous < boundary && total >= boundary) {
                notifier_.notify(BudgetAlert{
                    .subscriptionId = subscription.subscriptionId,
                    .customer = subscription.customer,
                    .spent = static_cast<double>(total) / kMicroUnits,
                    .limit = limit,
                    .threshold = threshold,
                });
            }
        }
    }
    return static_cast<double>(total) / kMicroUnits;
}

std::string BudgetTracker::budgetKey(const std::string &subscriptionId) const {
    return budgetKey(subscriptionId, clock_());
}

std::string BudgetTracker::budgetKey(const std::string &subscriptionId, core::SystemClock::time_point at) {
    return "budget:" + subscriptionId + ":" + core::utcMonth(at);
}

}  // namespace llmgate::routing
