#include "providers/HealthChecker.hpp"

#include <cpr/cpr.h>
#include <trantor/utils/Logger.h>

namespace llmgate::providers {
namespace {

std::string healthUrl(std::string endpoint) {
    if (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }
    return endpoint + "/health";
}

}  // namespace

ProbeResponse CprHealthProbe::get(const std::string &url, std::chrono::milliseconds timeout) {
    cpr::Session session;
    session.SetUrl(cpr::Url{url});
    session.SetTimeout(cpr::Timeout{timeout});
    const auto response = session.Get();

    ProbeResponse probe;
    probe.latencyMs = response.elapsed * 1000.0;
    if (response.error.code != cpr::ErrorCode::OK) {
        probe.error = response.error.message;
        return probe;
    }
    probe.reachable = true;
    probe.statusCode = response.status_code;
    return probe;
}

BackendHealthChecker::BackendHealthChecker(store::DurableStore &store, HealthProbe &probe, std::chrono::milliseconds timeout)
    : store_(store), probe_(probe), timeout_(timeout) {}

HealthObservation BackendHealthChecker::check(const store::BackendProfile &backend) {
    HealthObservation observation;

    const auto primary = probe_.get(healthUrl(backend.endpointUrl), timeout_);
    if (primary.reachable) {
        observation.latencyMs = primary.latencyMs;
        if (primary.statusCode == 200) {
            observation.health = store::HealthState::Up;
        } else if (primary.statusCode == 503) {
            observation.health = store::HealthState::Degraded;
        } else {
            observation.health = store::HealthState::Down;
        }
        return observation;
    }

    LOG_DEBUG << "Health endpoint of " << backend.name << " unreachable (" << primary.error << "); probing base URL";
    const auto fallback = probe_.get(backend.endpointUrl, timeout_);
    if (!fallback.reachable) {
        observation.health = store::HealthState::Down;
        return observation;
    }
    observation.latencyMs = fallback.latencyMs;
    observation.health = fallback.statusCode < 500 ? store::HealthState::Up : store::HealthState::Down;
    return observation;
}

std::size_t BackendHealthChecker::checkAll() {
    std::size_t checked = 0;
    for (const auto &backend : store_.listBackends()) {
        if (!backend.active) {
            continue;
        }
        const auto observation = check(backend);
        if (observation.health != backend.health) {
            LOG_INFO << "Backend " << backend.name << " health " << std::string(store::toString(backend.health)) << " -> "
                     << std::string(store::toString(observation.health));
        }
        try {
            store_.updateHealth(backend.name, observation.health, observation.latencyMs);
        } catch (const std::exception &ex) {
            LOG_WARN << "Health update for " << backend.name << " failed: " << ex.what();
        }
        ++checked;
    }
    return checked;
}

}  // namespace llmgate::providers
