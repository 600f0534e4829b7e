#include "llmgate/environment.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace llmgate {
namespace {

std::string trim(std::string_view input) {
    auto begin = input.begin();
    auto end = input.end();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
        ++begin;
    }
    while (end != begin) {
        auto prev = end;
        --prev;
        if (!std::isspace(static_cast<unsigned char>(*prev))) {
            break;
        }
        end = prev;
    }
    return std::string(begin, end);
}

bool isQuoted(const std::string &value) {
    if (value.size() < 2) {
        return false;
    }
    return (value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\'');
}

}  // namespace

bool loadDotEnv(const std::filesystem::path &path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(input, line)) {
        auto content = trim(line);
        if (content.empty() || content.front() == '#') {
            continue;
        }
        if (content.rfind("export ", 0) == 0) {
            content = trim(std::string_view(content).substr(7));
        }

        const auto separator = content.find('=');
        if (separator == std::string::npos) {
            continue;
        }

        const auto key = trim(std::string_view(content).substr(0, separator));
        auto value = trim(std::string_view(content).substr(separator + 1));
        if (isQuoted(value)) {
            value = value.substr(1, value.size() - 2);
        }
        if (key.empty()) {
            continue;
        }

        // Variables already present in the process environment win over the file.
        ::setenv(key.c_str(), value.c_str(), 0);
    }

    return true;
}

std::optional<std::string> getEnv(std::string_view key) {
    const char *value = std::getenv(std::string(key).c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string getEnvOrDefault(std::string_view key, std::string_view defaultValue) {
    auto value = getEnv(key);
    if (!value || value->empty()) {
        return std::string(defaultValue);
    }
    return *value;
}

bool getEnvFlag(std::string_view key, bool defaultValue) {
    auto value = getEnv(key);
    if (!value) {
        return defaultValue;
    }

    std::string lowered = *value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        return false;
    }
    return defaultValue;
}

double getEnvDouble(std::string_view key, double defaultValue) {
    auto value = getEnv(key);
    if (!value || value->empty()) {
        return defaultValue;
    }
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(*value, &consumed);
        if (consumed != value->size()) {
            return defaultValue;
        }
        return parsed;
    } catch (const std::exception &) {
        return defaultValue;
    }
}

std::string expandEnvPlaceholder(const std::string &text) {
    if (text.size() < 3 || text.rfind("${", 0) != 0 || text.back() != '}') {
        return text;
    }
    const auto inner = text.substr(2, text.size() - 3);
    const auto delimiter = inner.find(":-");
    const auto name = inner.substr(0, delimiter);
    const auto fallback = delimiter == std::string::npos ? std::string{} : inner.substr(delimiter + 2);
    return getEnvOrDefault(name, fallback);
}

}  // namespace llmgate
