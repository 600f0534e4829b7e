#include "llmgate/logging.h"

#include <nlohmann/json.hpp>
#include <trantor/utils/Logger.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace llmgate {
namespace {

std::mutex logMutex;
std::unique_ptr<std::ofstream> fileSink;
bool stdoutEnabled = true;

std::mutex rulesMutex;
std::vector<std::regex> redactionRules;

thread_local LogContext threadLogContext{};

std::vector<std::regex> defaultRedactionRules() {
    std::vector<std::regex> rules;
    rules.emplace_back(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})", std::regex::icase);
    rules.emplace_back(R"((?:\b\d{4}[- ]?){3}\d{4}\b)");
    rules.emplace_back(R"((?:api[_-]?key|token|secret|authorization)\s*[:=]\s*[^\s,]+)", std::regex::icase);
    rules.emplace_back(R"(bearer\s+[A-Za-z0-9._~+/=-]+)", std::regex::icase);
    return rules;
}

std::string isoTimestampUtc() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto seconds = time_point_cast<std::chrono::seconds>(now);
    const auto micro = duration_cast<microseconds>(now - seconds).count();
    const std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(6) << std::setfill('0') << micro << 'Z';
    return oss.str();
}

trantor::Logger::LogLevel toTrantorLevel(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (level == "trace") {
        return trantor::Logger::kTrace;
    }
    if (level == "debug") {
        return trantor::Logger::kDebug;
    }
    if (level == "warn" || level == "warning") {
        return trantor::Logger::kWarn;
    }
    if (level == "error") {
        return trantor::Logger::kError;
    }
    if (level == "fatal" || level == "critical") {
        return trantor::Logger::kFatal;
    }
    return trantor::Logger::kInfo;
}

// trantor formats lines as "<date> <tid> LEVEL <msg> - file:line"; the level is the third token.
std::string extractLevel(std::string_view line) {
    static const std::vector<std::string> levels{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    for (const auto &level : levels) {
        const auto needle = " " + level + " ";
        if (line.find(needle) != std::string_view::npos) {
            return level;
        }
    }
    return "INFO";
}

template <typename T>
nlohmann::json nullIfEmpty(const T &value, bool empty) {
    if (empty) {
        return nullptr;
    }
    return value;
}

void emitLine(const std::string &serialized) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (stdoutEnabled) {
        std::cout << serialized << '\n';
    }
    if (fileSink && fileSink->is_open()) {
        (*fileSink) << serialized << '\n';
    }
}

void openFileSink(const std::filesystem::path &path) {
    if (path.empty()) {
        return;
    }
    if (auto parent = path.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    std::lock_guard<std::mutex> lock(logMutex);
    fileSink = std::make_unique<std::ofstream>(path, std::ios::app);
}

}  // namespace

ScopedLogContext::ScopedLogContext(LogContext context) : previous_(threadLogContext) {
    threadLogContext = std::move(context);
}

ScopedLogContext::~ScopedLogContext() {
    threadLogContext = std::move(previous_);
}

void initializeLogging(const std::string &level, const YAML::Node &loggingConfig) {
    using trantor::Logger;

    Logger::setLogLevel(toTrantorLevel(level));

    std::vector<std::regex> rules = defaultRedactionRules();
    std::vector<std::string> rejectedPatterns;

    if (loggingConfig) {
        if (const auto logging = loggingConfig["logging"]; logging) {
            stdoutEnabled = logging["stdout"].as<bool>(true);
            if (const auto fileNode = logging["file"]; fileNode && fileNode["enabled"].as<bool>(false)) {
                openFileSink(fileNode["path"].as<std::string>(""));
            }
            const auto redact = logging["redact"];
            if (const auto patterns = redact ? redact["patterns"] : YAML::Node{}; patterns && patterns.IsSequence()) {
                for (const auto &pattern : patterns) {
                    const auto text = pattern.as<std::string>("");
                    try {
                        rules.emplace_back(text, std::regex::icase);
                    } catch (const std::regex_error &) {
                        rejectedPatterns.push_back(text);
                    }
                }
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(rulesMutex);
        redactionRules = std::move(rules);
    }

    Logger::setOutputFunction(
        [](const char *msg, const uint64_t len) {
            std::string_view view(msg, len);
            while (!view.empty() && (view.back() == '\n' || view.back() == '\r')) {
                view.remove_suffix(1);
            }

            const auto context = currentLogContext();
            nlohmann::json payload;
            payload["ts"] = isoTimestampUtc();
            payload["level"] = extractLevel(view);
            payload["msg"] = redactMessage(view);
            payload["request_id"] = nullIfEmpty(context.requestId, context.requestId.empty());
            payload["subscription"] = nullIfEmpty(context.subscription, context.subscription.empty());
            payload["backend"] = nullIfEmpty(context.backend, context.backend.empty());
            payload["endpoint"] = nullIfEmpty(context.endpoint, context.endpoint.empty());
            payload["status"] = nullIfEmpty(context.status, context.status == 0);
            payload["latency_ms"] = nullIfEmpty(context.latencyMs, context.latencyMs <= 0.0);

            emitLine(payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        },
        []() {
            std::lock_guard<std::mutex> lock(logMutex);
            std::cout << std::flush;
            if (fileSink && fileSink->is_open()) {
                fileSink->flush();
            }
        });

    for (const auto &pattern : rejectedPatterns) {
        LOG_WARN << "Invalid redaction regex ignored: " << pattern;
    }
    LOG_INFO << "Logging initialized at level " << level;
}

void setLogContext(const LogContext &context) {
    threadLogContext = context;
}

void updateLogContext(const LogContext &context) {
    if (!context.requestId.empty()) {
        threadLogContext.requestId = context.requestId;
    }
    if (!context.subscription.empty()) {
        threadLogContext.subscription = context.subscription;
    }
    if (!context.backend.empty()) {
        threadLogContext.backend = context.backend;
    }
    if (!context.endpoint.empty()) {
        threadLogContext.endpoint = context.endpoint;
    }
    if (context.status != 0) {
        threadLogContext.status = context.status;
    }
    if (context.latencyMs > 0.0) {
        threadLogContext.latencyMs = context.latencyMs;
    }
}

LogContext currentLogContext() {
    return threadLogContext;
}

void clearLogContext() {
    threadLogContext = LogContext{};
}

std::string redactMessage(std::string_view message) {
    std::string sanitized(message);
    std::lock_guard<std::mutex> lock(rulesMutex);
    if (redactionRules.empty()) {
        redactionRules = defaultRedactionRules();
    }
    for (const auto &rule : redactionRules) {
        sanitized = std::regex_replace(sanitized, rule, "[REDACTED]");
    }
    return sanitized;
}

std::string maskApiKey(std::string_view apiKey) {
    constexpr std::size_t kVisiblePrefix = 8;
    if (apiKey.size() <= kVisiblePrefix) {
        return "****";
    }
    return std::string(apiKey.substr(0, kVisiblePrefix)) + "****";
}

}  // namespace llmgate
