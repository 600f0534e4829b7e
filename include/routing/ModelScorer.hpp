#pragma once

#include "store/Records.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}  // namespace YAML

namespace llmgate::routing {

struct ScoringWeights {
    double latency{1.0};
    double capacity{0.5};
    double cost{1.5};
    double priority{2.0};
    double success{0.3};
    double planCostWeight{3.0};
    double degradedPenalty{-10.0};

    // Reads `routing.weights` overrides; WEIGHT_* environment variables win over the file.
    static ScoringWeights load(const YAML::Node &routingConfig);

    void validate() const;
};

struct ScoredBackend {
    store::BackendProfile backend;
    double score{0.0};
};

class ModelScorer {
   public:
    explicit ModelScorer(ScoringWeights weights = {});

    // Zero for inactive or Down backends; otherwise the weighted sum of latency, capacity, cost,
    // priority, success rate, plan weighting and the degraded penalty.
    [[nodiscard]] double score(const store::BackendProfile &backend, double subscriptionPriority, double planCostWeight) const;

    // Eligible candidates ordered by descending score; equal scores keep their input order.
    [[nodiscard]] std::vector<ScoredBackend> rank(const std::vector<store::BackendProfile> &candidates,
                                                  double subscriptionPriority,
                                                  const std::map<std::string, double> &costWeights) const;

    [[nodiscard]] std::optional<ScoredBackend> select(const std::vector<store::BackendProfile> &candidates,
                                                      double subscriptionPriority,
                                                      const std::map<std::string, double> &costWeights) const;

    [[nodiscard]] const ScoringWeights &weights() const { return weights_; }

   private:
    ScoringWeights weights_;
};

}  // namespace llmgate::routing
