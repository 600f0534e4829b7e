#include "routing/ModeProfiles.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace llmgate::routing {
namespace {

constexpr TaskComplexity kAllClasses[] = {TaskComplexity::Simple, TaskComplexity::Reasoning, TaskComplexity::Complex,
                                          TaskComplexity::Multimodal};
constexpr RoutingMode kAllModes[] = {RoutingMode::Auto, RoutingMode::Performance, RoutingMode::Efficient,
                                     RoutingMode::Lite};

ModeWeights parseWeights(const YAML::Node &node, const std::string &where) {
    if (!node.IsMap()) {
        throw std::invalid_argument("mode weights at '" + where + "' must be a map of backend to weight");
    }
    ModeWeights weights;
    for (const auto &entry : node) {
        const auto backend = entry.first.as<std::string>();
        const auto weight = entry.second.as<double>();
        if (weight < 0.0) {
            throw std::invalid_argument("mode weight for " + backend + " at '" + where + "' cannot be negative");
        }
        weights[backend] = weight;
    }
    return weights;
}

}  // namespace

std::string_view toString(RoutingMode mode) {
    switch (mode) {
        case RoutingMode::Auto:
            return "auto";
        case RoutingMode::Performance:
            return "performance";
        case RoutingMode::Efficient:
            return "efficient";
        case RoutingMode::Lite:
            return "lite";
    }
    return "auto";
}

std::optional<RoutingMode> parseRoutingMode(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (auto mode : kAllModes) {
        if (value == toString(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

ModeProfiles ModeProfiles::defaults() {
    ModeProfiles profiles;
    profiles.set(RoutingMode::Auto, TaskComplexity::Simple,
                 {{"DeepSeek", 80}, {"Grok", 10}, {"Gemini", 5}, {"Claude", 3}, {"GPT-4", 2}});
    profiles.set(RoutingMode::Auto, TaskComplexity::Reasoning,
                 {{"DeepSeek", 40}, {"Grok", 40}, {"Gemini", 10}, {"Claude", 7}, {"GPT-4", 3}});
    profiles.set(RoutingMode::Auto, TaskComplexity::Complex,
                 {{"Claude", 50}, {"GPT-4", 25}, {"Gemini", 15}, {"Grok", 8}, {"DeepSeek", 2}});
    profiles.set(RoutingMode::Auto, TaskComplexity::Multimodal,
                 {{"Gemini", 70}, {"Claude", 15}, {"GPT-4", 10}, {"Grok", 3}, {"DeepSeek", 2}});

    profiles.setAll(RoutingMode::Performance, {{"Claude", 60}, {"GPT-4", 30}, {"Gemini", 8}, {"Grok", 2}, {"DeepSeek", 0}});

    profiles.setAll(RoutingMode::Efficient, {{"DeepSeek", 90}, {"Grok", 8}, {"Gemini", 2}, {"Claude", 0}, {"GPT-4", 0}});
    profiles.set(RoutingMode::Efficient, TaskComplexity::Reasoning,
                 {{"DeepSeek", 60}, {"Grok", 35}, {"Gemini", 3}, {"Claude", 2}, {"GPT-4", 0}});

    profiles.setAll(RoutingMode::Lite, {{"Grok", 70}, {"DeepSeek", 30}, {"Gemini", 0}, {"Claude", 0}, {"GPT-4", 0}});
    return profiles;
}

ModeProfiles ModeProfiles::load(const YAML::Node &modesConfig) {
    auto profiles = defaults();
    if (!modesConfig || modesConfig.IsNull()) {
        return profiles;
    }
    if (!modesConfig.IsMap()) {
        throw std::invalid_argument("'modes' must be a map keyed by routing mode");
    }

    for (const auto &modeEntry : modesConfig) {
        const auto modeName = modeEntry.first.as<std::string>();
        const auto mode = parseRoutingMode(modeName);
        if (!mode.has_value()) {
            throw std::invalid_argument("unknown routing mode '" + modeName + "' in modes configuration");
        }
        const YAML::Node classes = modeEntry.second;
        if (!classes.IsMap()) {
            throw std::invalid_argument("mode '" + modeName + "' must map complexity classes to weights");
        }

        // "all" first so that class-specific entries in the same block take precedence.
        if (const auto all = classes["all"]) {
            profiles.setAll(*mode, parseWeights(all, modeName + ".all"));
        }
        for (const auto &classEntry : classes) {
            const auto className = classEntry.first.as<std::string>();
            if (className == "all") {
                continue;
            }
            const auto complexity = parseTaskComplexity(className);
            if (!complexity.has_value()) {
                throw std::invalid_argument("unknown complexity class '" + className + "' under mode '" + modeName + "'");
            }
            profiles.set(*mode, *complexity, parseWeights(classEntry.second, modeName + "." + className));
        }
    }
    return profiles;
}

ModeWeights ModeProfiles::weights(RoutingMode mode, TaskComplexity complexity) const {
    auto it = table_.find({mode, complexity});
    if (it == table_.end()) {
        return {};
    }
    return it->second;
}

void ModeProfiles::set(RoutingMode mode, TaskComplexity complexity, ModeWeights weights) {
    table_[{mode, complexity}] = std::move(weights);
}

void ModeProfiles::setAll(RoutingMode mode, const ModeWeights &weights) {
    for (auto complexity : kAllClasses) {
        table_[{mode, complexity}] = weights;
    }
}

std::map<std::string, double> overrideCostWeights(const std::map<std::string, double> &planWeights,
                                                  const ModeWeights &overrides) {
    auto merged = planWeights;
    for (auto &[backend, weight] : merged) {
        if (auto it = overrides.find(backend); it != overrides.end()) {
            weight = it->second;
        }
    }
    return merged;
}

}  // namespace llmgate::routing
