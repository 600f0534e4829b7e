#include "routing/TaskClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace llmgate::routing {

std::string_view toString(TaskComplexity complexity) {
    switch (complexity) {
        case TaskComplexity::Simple:
            return "simple";
        case TaskComplexity::Reasoning:
            return "reasoning";
        case TaskComplexity::Complex:
            return "complex";
        case TaskComplexity::Multimodal:
            return "multimodal";
    }
    return "simple";
}

std::optional<TaskComplexity> parseTaskComplexity(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (auto complexity : {TaskComplexity::Simple, TaskComplexity::Reasoning, TaskComplexity::Complex,
                            TaskComplexity::Multimodal}) {
        if (value == toString(complexity)) {
            return complexity;
        }
    }
    return std::nullopt;
}

TaskClassifier::TaskClassifier() : TaskClassifier(ClassifierPatterns{}) {}

TaskClassifier::TaskClassifier(ClassifierPatterns patterns) : config_(std::move(patterns)) {
    if (config_.reasoningTokenThreshold > config_.complexTokenThreshold) {
        throw std::invalid_argument("reasoning token threshold cannot exceed the complex threshold");
    }
    if (config_.shortPromptLength > config_.mediumPromptLength) {
        throw std::invalid_argument("short prompt length cannot exceed the medium prompt length");
    }
    classes_.push_back(compile(TaskComplexity::Multimodal, config_.multimodal));
    classes_.push_back(compile(TaskComplexity::Complex, config_.complex));
    classes_.push_back(compile(TaskComplexity::Reasoning, config_.reasoning));
    classes_.push_back(compile(TaskComplexity::Simple, config_.simple));
}

TaskComplexity TaskClassifier::classify(std::string_view prompt, std::size_t approxTokens) const {
    const std::string text(prompt);
    for (const auto &entry : classes_) {
        for (const auto &pattern : entry.patterns) {
            if (std::regex_search(text, pattern)) {
                return entry.complexity;
            }
        }
    }

    if (approxTokens > config_.complexTokenThreshold) {
        return TaskComplexity::Complex;
    }
    if (approxTokens > config_.reasoningTokenThreshold) {
        return TaskComplexity::Reasoning;
    }

    if (prompt.size() < config_.shortPromptLength) {
        return TaskComplexity::Simple;
    }
    if (prompt.size() < config_.mediumPromptLength) {
        return TaskComplexity::Reasoning;
    }
    return TaskComplexity::Complex;
}

TaskClassifier::CompiledClass TaskClassifier::compile(TaskComplexity complexity, const std::vector<std::string> &patterns) {
    CompiledClass compiled{complexity, {}};
    compiled.patterns.reserve(patterns.size());
    for (const auto &pattern : patterns) {
        try {
            compiled.patterns.emplace_back(pattern, std::regex::icase | std::regex::optimize);
        } catch (const std::regex_error &ex) {
            throw std::invalid_argument("invalid " + std::string(toString(complexity)) + " pattern '" + pattern +
                                        "': " + ex.what());
        }
    }
    return compiled;
}

}  // namespace llmgate::routing
