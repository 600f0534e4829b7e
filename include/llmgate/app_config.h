#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace YAML {
class Node;
}  // namespace YAML

namespace llmgate {

struct AppConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8080};
    std::size_t threads{0};
    bool dryRun{false};
    std::string logLevel{"info"};
    std::string gatewayConfigPath{"config/gateway.yaml"};
};

AppConfig loadAppConfig(const YAML::Node &serverConfig, const YAML::Node &loggingConfig);
void applyAppConfig(const AppConfig &config);

}  // namespace llmgate
