#pragma once

#include "routing/TaskClassifier.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace YAML {
class Node;
}  // namespace YAML

namespace llmgate::routing {

enum class RoutingMode {
    Auto,
    Performance,
    Efficient,
    Lite,
};

std::string_view toString(RoutingMode mode);
std::optional<RoutingMode> parseRoutingMode(std::string_view text);

// Relative per-backend weights; they replace the plan cost weight for one selection only.
using ModeWeights = std::map<std::string, double>;

class ModeProfiles {
   public:
    // auto varies by complexity, performance favors the quality backends, efficient the cheapest
    // ones (with more room for the fast backend on reasoning), lite only the free tiers.
    static ModeProfiles defaults();

    // Defaults overlaid with the `modes` section: `modes.<mode>.<class>` or `modes.<mode>.all`.
    static ModeProfiles load(const YAML::Node &modesConfig);

    [[nodiscard]] ModeWeights weights(RoutingMode mode, TaskComplexity complexity) const;

    void set(RoutingMode mode, TaskComplexity complexity, ModeWeights weights);
    void setAll(RoutingMode mode, const ModeWeights &weights);

   private:
    std::map<std::pair<RoutingMode, TaskComplexity>, ModeWeights> table_;
};

// Plan weights with every backend named by `overrides` replaced; backends the plan does not
// allow are never added.
std::map<std::string, double> overrideCostWeights(const std::map<std::string, double> &planWeights,
                                                  const ModeWeights &overrides);

}  // namespace llmgate::routing
