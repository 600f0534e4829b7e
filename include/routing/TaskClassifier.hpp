#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace llmgate::routing {

enum class TaskComplexity {
    Simple,
    Reasoning,
    Complex,
    Multimodal,
};

std::string_view toString(TaskComplexity complexity);
std::optional<TaskComplexity> parseTaskComplexity(std::string_view text);

struct ClassifierPatterns {
    std::vector<std::string> multimodal{"visualize", "diagram", "chart", "image", "screenshot"};
    std::vector<std::string> complex{"review", "architecture", "design pattern", "refactor", "optimize", "comprehensive"};
    std::vector<std::string> reasoning{"debug", "test", "unit test", "algorithm", "logic", "calculate"};
    std::vector<std::string> simple{"what is", "explain briefly", "todo", "list", "simple", "quick"};

    std::size_t complexTokenThreshold{10000};
    std::size_t reasoningTokenThreshold{5000};
    std::size_t shortPromptLength{100};
    std::size_t mediumPromptLength{500};
};

// Keyword heuristic: multimodal, complex, reasoning and simple term lists are tried in that order,
// then token-count thresholds, then prompt length.
class TaskClassifier {
   public:
    TaskClassifier();
    explicit TaskClassifier(ClassifierPatterns patterns);
    virtual ~TaskClassifier() = default;

    [[nodiscard]] virtual TaskComplexity classify(std::string_view prompt, std::size_t approxTokens) const;

   private:
    struct CompiledClass {
        TaskComplexity complexity;
        std::vector<std::regex> patterns;
    };

    static CompiledClass compile(TaskComplexity complexity, const std::vector<std::string> &patterns);

    ClassifierPatterns config_;
    std::vector<CompiledClass> classes_;
};

}  // namespace llmgate::routing
