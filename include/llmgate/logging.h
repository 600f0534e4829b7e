#pragma once

#include <string>
#include <string_view>

namespace YAML {
class Node;
}  // namespace YAML

namespace llmgate {

struct LogContext {
    std::string requestId;
    std::string subscription;
    std::string backend;
    std::string endpoint;
    int status{0};
    double latencyMs{0.0};
};

// Installs a context for the current thread and puts the previous one back on destruction.
class ScopedLogContext {
  public:
    explicit ScopedLogContext(LogContext context);
    ScopedLogContext(const ScopedLogContext &) = delete;
    ScopedLogContext &operator=(const ScopedLogContext &) = delete;
    ~ScopedLogContext();

  private:
    LogContext previous_;
};

void initializeLogging(const std::string &level, const YAML::Node &loggingConfig);

void setLogContext(const LogContext &context);
void updateLogContext(const LogContext &context);
LogContext currentLogContext();
void clearLogContext();

std::string redactMessage(std::string_view message);
std::string maskApiKey(std::string_view apiKey);

}  // namespace llmgate
