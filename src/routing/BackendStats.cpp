#include "routing/BackendStats.hpp"

#include <trantor/utils/Logger.h>

namespace llmgate::routing {

void applyCallOutcome(store::BackendProfile &profile, bool success, std::optional<double> latencyMs) {
    profile.totalRequests += 1;
    if (!success) {
        profile.failedRequests += 1;
    }

    const auto total = static_cast<double>(profile.totalRequests);
    profile.successRate = (total - static_cast<double>(profile.failedRequests)) / total * 100.0;

    if (latencyMs.has_value()) {
        profile.avgLatencyMs = (profile.avgLatencyMs * (total - 1.0) + *latencyMs) / total;
    }
}

StoreBackendStatsRecorder::StoreBackendStatsRecorder(store::DurableStore &store) : store_(store) {}

void StoreBackendStatsRecorder::recordOutcome(const std::string &backend, bool success, std::optional<double> latencyMs) {
    try {
        const bool updated = store_.updateBackend(backend, [&](store::BackendProfile &profile) {
            applyCallOutcome(profile, success, latencyMs);
        });
        if (!updated) {
            LOG_WARN << "Statistics update skipped; backend " << backend << " is not in the store";
        }
    } catch (const std::exception &ex) {
        LOG_WARN << "Statistics update for " << backend << " failed: " << ex.what();
    }
}

}  // namespace llmgate::routing
