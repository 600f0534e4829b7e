#include <drogon/drogon.h>
#include <json/json.h>
#include <trantor/net/EventLoopThread.h>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>
#include <signal.h>

#include "core/Metrics.hpp"
#include "http/HttpServer.hpp"
#include "llmgate/app_config.h"
#include "llmgate/environment.h"
#include "llmgate/gateway.h"
#include "llmgate/logging.h"
#include "llmgate/middleware/request_id.h"

namespace {
std::atomic<bool> shutdownRequested{false};

void installSignalHandlers() {
    sigset_t sigset;
    sigemptyset(&sigset);
    sigaddset(&sigset, SIGINT);
    sigaddset(&sigset, SIGTERM);

    pthread_sigmask(SIG_BLOCK, &sigset, nullptr);

    std::thread([sigset]() mutable {
        int signo = 0;
        while (sigwait(&sigset, &signo) == 0) {
            if (!shutdownRequested.exchange(true)) {
                drogon::app().getLoop()->queueInLoop([]() {
                    LOG_INFO << "Shutdown signal received. Stopping server.";
                    drogon::app().quit();
                });
            }
        }
    }).detach();
}

std::uint64_t getAttributeCount(const drogon::AttributesPtr &attributes, const std::string &key) {
    if (!attributes) {
        return 0;
    }
    try {
        return attributes->get<std::uint64_t>(key);
    } catch (const std::exception &) {
        return 0;
    }
}

template <typename T>
std::shared_ptr<T> getSharedAttribute(const drogon::AttributesPtr &attributes, const std::string &key) {
    if (!attributes) {
        return nullptr;
    }
    try {
        return attributes->get<std::shared_ptr<T>>(key);
    } catch (const std::exception &) {
        return nullptr;
    }
}

YAML::Node loadYaml(const std::string &path) {
    try {
        return YAML::LoadFile(path);
    } catch (const std::exception &ex) {
        std::cerr << "Failed to load " << path << ": " << ex.what() << std::endl;
        return YAML::Node();
    }
}

void runHealthChecks(llmgate::Gateway &gateway) {
    try {
        const auto checked = gateway.healthChecker().checkAll();
        LOG_DEBUG << "Health check pass finished for " << checked << " backends";
    } catch (const std::exception &ex) {
        LOG_ERROR << "Health check pass failed: " << ex.what();
    }
}

}  // namespace

int main() {
    using namespace drogon;

    llmgate::loadDotEnv(".env");

    const auto serverConfig = loadYaml("config/server.yaml");
    const auto loggingConfig = loadYaml("config/logging.yaml");

    auto config = llmgate::loadAppConfig(serverConfig, loggingConfig);

    llmgate::initializeLogging(config.logLevel, loggingConfig);

    std::unique_ptr<llmgate::Gateway> gateway;
    try {
        gateway = std::make_unique<llmgate::Gateway>(YAML::LoadFile(config.gatewayConfigPath), config.dryRun);
    } catch (const std::exception &ex) {
        LOG_FATAL << "Cannot start gateway from " << config.gatewayConfigPath << ": " << ex.what();
        return 1;
    }

    auto &application = drogon::app();
    application.enableServerHeader(false);
    application.enableDateHeader(true);

    llmgate::applyAppConfig(config);

    application.registerFilter(std::make_shared<llmgate::middleware::RequestIdMiddleware>());

    application.registerPostHandlingAdvice([](const HttpRequestPtr &req, const HttpResponsePtr &resp) {
        auto requestId = llmgate::http::requestIdFor(req);
        if (resp && !requestId.empty()) {
            resp->addHeader("X-Request-ID", requestId);
        }

        auto attributes = req->attributes();
        auto metricsContext = getSharedAttribute<llmgate::core::RequestObservation>(attributes, "observability.metrics");

        const auto statusCode = resp ? static_cast<unsigned>(resp->getStatusCode()) : 0U;
        const auto bytesOut = resp ? static_cast<std::uint64_t>(resp->body().size()) : 0ULL;
        const std::uint64_t tokensOut = getAttributeCount(attributes, "observability.tokens_out");

        if (metricsContext) {
            metricsContext->complete(statusCode, bytesOut, tokensOut);
        }

        llmgate::LogContext context = llmgate::currentLogContext();
        context.requestId = requestId;
        context.status = static_cast<int>(statusCode);
        context.latencyMs = metricsContext ? metricsContext->latencyMs() : 0.0;
        llmgate::updateLogContext(context);
        LOG_INFO << "request complete";

        llmgate::clearLogContext();
    });

    const std::string version = "0.1.0";
    const auto startTime = std::chrono::system_clock::now();

    application.registerHandler(
        "/health",
        [version, startTime](const HttpRequestPtr &req, std::function<void(const HttpResponsePtr &)> &&callback) {
            Json::Value payload(Json::objectValue);
            payload["status"] = "ok";
            payload["service"] = "llmgate";
            payload["version"] = version;
            payload["uptime_seconds"] = static_cast<Json::Int64>(
                std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - startTime).count());

            auto response = HttpResponse::newHttpJsonResponse(payload);
            response->setStatusCode(k200OK);
            callback(response);
        },
        {Get, llmgate::http::kRequestIdFilter});

    application.registerHandler(
        "/version",
        [version](const HttpRequestPtr &req, std::function<void(const HttpResponsePtr &)> &&callback) {
            Json::Value payload(Json::objectValue);
            payload["service"] = "llmgate";
            payload["version"] = version;

            auto response = HttpResponse::newHttpJsonResponse(payload);
            response->setStatusCode(k200OK);
            callback(response);
        },
        {Get, llmgate::http::kRequestIdFilter});

    application.registerHandler(
        "/metrics",
        [](const HttpRequestPtr &req, std::function<void(const HttpResponsePtr &)> &&callback) {
            auto body = llmgate::core::MetricsRegistry::instance().renderPrometheus();
            auto response = HttpResponse::newHttpResponse();
            response->setStatusCode(k200OK);
            response->setContentTypeString("text/plain; version=0.0.4");
            response->setBody(std::move(body));
            callback(response);
        },
        {Get, llmgate::http::kRequestIdFilter});

    llmgate::http::HttpServer::registerRoutes(*gateway);

    // Probes block on the network, so they get their own loop.
    trantor::EventLoopThread healthLoop("HealthCheck");
    healthLoop.run();
    auto *gatewayPtr = gateway.get();
    const auto healthInterval = std::chrono::duration<double>(gateway->settings().healthCheckInterval).count();
    healthLoop.getLoop()->queueInLoop([gatewayPtr]() { runHealthChecks(*gatewayPtr); });
    healthLoop.getLoop()->runEvery(healthInterval, [gatewayPtr]() { runHealthChecks(*gatewayPtr); });

    const auto purgeInterval = std::chrono::duration<double>(gateway->settings().cachePurgeInterval).count();
    application.getLoop()->runEvery(purgeInterval, [gatewayPtr]() {
        const auto purged = gatewayPtr->purgeExpiredCache();
        if (purged > 0) {
            LOG_TRACE << "Purged " << purged << " expired cache entries";
        }
    });

    installSignalHandlers();

    LOG_INFO << "Starting llmgate on " << config.host << ':' << config.port;

    application.run();
    LOG_INFO << "Server stopped.";

    healthLoop.getLoop()->quit();
    healthLoop.wait();
    gateway->shutdown();

    return 0;
}
