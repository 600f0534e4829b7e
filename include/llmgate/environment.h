#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace llmgate {

bool loadDotEnv(const std::filesystem::path &path);
std::optional<std::string> getEnv(std::string_view key);
std::string getEnvOrDefault(std::string_view key, std::string_view defaultValue);
bool getEnvFlag(std::string_view key, bool defaultValue);
double getEnvDouble(std::string_view key, double defaultValue);

// Expands a whole-value "${NAME}" or "${NAME:-fallback}" placeholder; any other text is returned unchanged.
std::string expandEnvPlaceholder(const std::string &text);

}  // namespace llmgate
