#include "llmgate/app_config.h"

#include "llmgate/environment.h"

#include <drogon/drogon.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace llmgate {
namespace {

std::uint16_t parsePort(const std::string &value, std::uint16_t fallback) {
    try {
        const auto port = std::stoul(value);
        if (port == 0 || port > 65535U) {
            return fallback;
        }
        return static_cast<std::uint16_t>(port);
    } catch (const std::exception &) {
        return fallback;
    }
}

}  // namespace

AppConfig loadAppConfig(const YAML::Node &serverConfig, const YAML::Node &loggingConfig) {
    AppConfig defaults{};

    if (serverConfig) {
        if (const auto listeners = serverConfig["listeners"]; listeners && listeners.IsSequence() && listeners.size() > 0) {
            const auto listener = listeners[0];
            defaults.host = listener["address"].as<std::string>(defaults.host);
            defaults.port = static_cast<std::uint16_t>(listener["port"].as<std::uint32_t>(defaults.port));
        }
        if (const auto app = serverConfig["app"]; app) {
            defaults.dryRun = app["dry_run"].as<bool>(defaults.dryRun);
            defaults.threads = app["threads"].as<std::size_t>(defaults.threads);
            defaults.gatewayConfigPath = app["gateway_config"].as<std::string>(defaults.gatewayConfigPath);
        }
    }

    if (loggingConfig) {
        if (const auto logging = loggingConfig["logging"]; logging) {
            defaults.logLevel = logging["level"].as<std::string>(defaults.logLevel);
        }
    }

    AppConfig config = defaults;
    config.host = getEnvOrDefault("HOST", defaults.host);
    config.port = parsePort(getEnvOrDefault("PORT", std::to_string(defaults.port)), defaults.port);
    config.dryRun = getEnvFlag("DRY_RUN", defaults.dryRun);
    config.logLevel = getEnvOrDefault("LOG_LEVEL", defaults.logLevel);
    config.gatewayConfigPath = getEnvOrDefault("GATEWAY_CONFIG", defaults.gatewayConfigPath);
    return config;
}

void applyAppConfig(const AppConfig &config) {
    auto &application = drogon::app();
    application.addListener(config.host, config.port);
    if (config.threads > 0) {
        application.setThreadNum(config.threads);
    }

    if (config.dryRun) {
        LOG_WARN << "DRY_RUN mode is enabled; upstream backends will not be called.";
    }
}

}  // namespace llmgate
