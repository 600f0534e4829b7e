#pragma once

#include "cache/SharedCache.hpp"
#include "core/UtcCalendar.hpp"
#include "routing/SubscriptionContext.hpp"

#include <functional>
#include <string>
#include <vector>

namespace llmgate::routing {

struct BudgetAlert {
    std::string subscriptionId;
    std::string customer;
    double spent{0.0};
    double limit{0.0};
    // Fraction of the limit that was crossed (0.8 or 1.0).
    double threshold{0.0};
};

class BudgetNotifier {
   public:
    virtual ~BudgetNotifier() = default;

    virtual void notify(const BudgetAlert &alert) = 0;
};

class LoggingBudgetNotifier : public BudgetNotifier {
   public:
    void notify(const BudgetAlert &alert) override;
};

// Accumulates monthly spend per subscription in the shared cache and reports each threshold once,
// on the request whose spend crosses it.
class BudgetTracker {
   public:
    using Clock = std::function<core::SystemClock::time_point()>;

    BudgetTracker(cache::SharedCache &cache, BudgetNotifier &notifier);
    BudgetTracker(cache::SharedCache &cache, BudgetNotifier &notifier, Clock clock, std::vector<double> thresholds = {0.8, 1.0});

    // Returns the subscription's spend for the current month after adding `amount`.
    double recordSpend(const SubscriptionContext &subscription, double amount);

    [[nodiscard]] std::string budgetKey(const std::string &subscriptionId) const;
    [[nodiscard]] static std::string budgetKey(const std::string &subscriptionId, core::SystemClock::time_point at);

   private:
    cache::SharedCache &cache_;
    BudgetNotifier &notifier_;
    Clock clock_;
    std::vector<double> thresholds_;
};

}  // namespace llmgate::routing
