#include "routing/ModelScorer.hpp"

#include "llmgate/environment.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <stdexcept>

namespace llmgate::routing {
namespace {

double weightFrom(const YAML::Node &weights, const char *key, const char *envName, double fallback) {
    double value = fallback;
    if (weights) {
        value = weights[key].as<double>(fallback);
    }
    return getEnvDouble(envName, value);
}

}  // namespace

ScoringWeights ScoringWeights::load(const YAML::Node &routingConfig) {
    ScoringWeights defaults;
    YAML::Node weights;
    if (routingConfig && routingConfig["weights"]) {
        weights = routingConfig["weights"];
    }

    ScoringWeights loaded;
    loaded.latency = weightFrom(weights, "latency", "WEIGHT_LATENCY", defaults.latency);
    loaded.capacity = weightFrom(weights, "capacity", "WEIGHT_CAPACITY", defaults.capacity);
    loaded.cost = weightFrom(weights, "cost", "WEIGHT_COST", defaults.cost);
    loaded.priority = weightFrom(weights, "priority", "WEIGHT_PRIORITY", defaults.priority);
    loaded.success = weightFrom(weights, "success", "WEIGHT_SUCCESS", defaults.success);
    loaded.planCostWeight = weightFrom(weights, "plan_cost_weight", "WEIGHT_PLAN_COST", defaults.planCostWeight);
    loaded.degradedPenalty =
        weightFrom(weights, "degraded_penalty", "WEIGHT_DEGRADED_PENALTY", defaults.degradedPenalty);
    loaded.validate();
    return loaded;
}

void ScoringWeights::validate() const {
    if (latency < 0.0 || capacity < 0.0 || cost < 0.0 || priority < 0.0 || success < 0.0 || planCostWeight < 0.0) {
        throw std::invalid_argument("scoring weights must not be negative");
    }
    if (degradedPenalty > 0.0) {
        throw std::invalid_argument("degraded penalty must be zero or negative");
    }
}

ModelScorer::ModelScorer(ScoringWeights weights) : weights_(weights) {
    weights_.validate();
}

double ModelScorer::score(const store::BackendProfile &backend, double subscriptionPriority, double planCostWeight) const {
    if (!backend.eligible()) {
        return 0.0;
    }

    double total = weights_.latency * (1.0 / (backend.avgLatencyMs + 1.0));
    total += weights_.capacity * (backend.capacityScore / 100.0);
    total -= weights_.cost * backend.costPerUnit;
    total += weights_.priority * subscriptionPriority;
    total += weights_.success * (backend.successRate / 100.0);
    total += weights_.planCostWeight * (planCostWeight / 10.0);
    if (backend.health == store::HealthState::Degraded) {
        total += weights_.degradedPenalty;
    }
    return total;
}

std::vector<ScoredBackend> ModelScorer::rank(const std::vector<store::BackendProfile> &candidates,
                                             double subscriptionPriority,
                                             const std::map<std::string, double> &costWeights) const {
    std::vector<ScoredBackend> ranked;
    ranked.reserve(candidates.size());
    for (const auto &candidate : candidates) {
        if (!candidate.eligible()) {
            continue;
        }
        auto weight = costWeights.find(candidate.name);
        const double planWeight = weight == costWeights.end() ? store::PlanRecord::kDefaultCostWeight : weight->second;
        ranked.push_back(ScoredBackend{candidate, score(candidate, subscriptionPriority, planWeight)});
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const ScoredBackend &lhs, const ScoredBackend &rhs) {
        return lhs.score > rhs.score;
    });
    return ranked;
}

std::optional<ScoredBackend> ModelScorer::select(const std::vector<store::BackendProfile> &candidates,
                                                 double subscriptionPriority,
                                                 const std::map<std::string, double> &costWeights) const {
    auto ranked = rank(candidates, subscriptionPriority, costWeights);
    if (ranked.empty()) {
        return std::nullopt;
    }
    return std::move(ranked.front());
}

}  // namespace llmgate::routing
