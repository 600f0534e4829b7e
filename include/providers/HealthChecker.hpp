#pragma once

#include "store/DurableStore.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace llmgate::providers {

struct ProbeResponse {
    bool reachable{false};
    long statusCode{0};
    double latencyMs{0.0};
    std::string error;
};

class HealthProbe {
   public:
    virtual ~HealthProbe() = default;

    virtual ProbeResponse get(const std::string &url, std::chrono::milliseconds timeout) = 0;
};

class CprHealthProbe : public HealthProbe {
   public:
    ProbeResponse get(const std::string &url, std::chrono::milliseconds timeout) override;
};

struct HealthObservation {
    store::HealthState health{store::HealthState::Down};
    std::optional<double> latencyMs;
};

// Probes `<endpoint>/health` (200 Up, 503 Degraded, anything else Down). When that request cannot
// be delivered the bare endpoint is probed instead: a status below 500 means Up.
class BackendHealthChecker {
   public:
    BackendHealthChecker(store::DurableStore &store, HealthProbe &probe, std::chrono::milliseconds timeout = std::chrono::seconds(5));

    HealthObservation check(const store::BackendProfile &backend);

    // Checks every active backend and writes the observations back; returns how many were checked.
    std::size_t checkAll();

   private:
    store::DurableStore &store_;
    HealthProbe &probe_;
    std::chrono::milliseconds timeout_;
};

}  // namespace llmgate::providers
