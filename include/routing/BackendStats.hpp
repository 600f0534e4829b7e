#pragma once

#include "store/DurableStore.hpp"

#include <optional>
#include <string>

namespace llmgate::routing {

// Post-call statistics sink. Updates are approximate read-modify-writes; a stricter implementation
// can be substituted without touching the router.
class BackendStatsRecorder {
   public:
    virtual ~BackendStatsRecorder() = default;

    virtual void recordOutcome(const std::string &backend, bool success, std::optional<double> latencyMs) = 0;
};

// Folds one call outcome into the profile's counters, success rate and rolling average latency.
void applyCallOutcome(store::BackendProfile &profile, bool success, std::optional<double> latencyMs);

class StoreBackendStatsRecorder : public BackendStatsRecorder {
   public:
    explicit StoreBackendStatsRecorder(store::DurableStore &store);

    void recordOutcome(const std::string &backend, bool success, std::optional<double> latencyMs) override;

   private:
    store::DurableStore &store_;
};

}  // namespace llmgate::routing
