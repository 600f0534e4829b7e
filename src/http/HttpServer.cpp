#include "http/HttpServer.hpp"

#include "core/Metrics.hpp"
#include "llmgate/gateway.h"
#include "llmgate/logging.h"

#include <drogon/drogon.h>
#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <string_view>

namespace llmgate::http {

namespace {

constexpr std::string_view kBearerPrefix = "bearer ";

std::string trim(std::string value) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

bool startsWithIgnoreCase(const std::string &value, std::string_view prefix) {
    if (value.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(value[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

Json::Value parseBody(const drogon::HttpRequestPtr &req) {
    const auto body = std::string(req->body());
    if (body.empty()) {
        return Json::Value(Json::nullValue);
    }
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value payload;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &payload, &errors)) {
        LOG_DEBUG << "Request body is not valid JSON: " << errors;
        return Json::Value(Json::nullValue);
    }
    return payload;
}

std::optional<std::string> stringField(const Json::Value &payload, const char *name) {
    if (!payload.isObject() || !payload.isMember(name)) {
        return std::nullopt;
    }
    const auto &value = payload[name];
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.asString();
}

std::optional<std::string> headerField(const drogon::HttpRequestPtr &req, const char *name) {
    auto value = trim(req->getHeader(name));
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::shared_ptr<core::RequestObservation> observationFor(const drogon::HttpRequestPtr &req) {
    auto attributes = req->attributes();
    if (!attributes) {
        return nullptr;
    }
    try {
        return attributes->get<std::shared_ptr<core::RequestObservation>>("observability.metrics");
    } catch (const std::exception &) {
        return nullptr;
    }
}

drogon::HttpResponsePtr internalErrorResponse() {
    Json::Value payload(Json::objectValue);
    payload["status"] = 500;
    payload["error"] = "internal_error";
    payload["message"] = "Internal server error";
    auto response = drogon::HttpResponse::newHttpJsonResponse(payload);
    response->setStatusCode(drogon::k500InternalServerError);
    return response;
}

drogon::HttpResponsePtr routeAndRespond(Gateway &gateway, const drogon::HttpRequestPtr &req) {
    LogContext context{};
    context.requestId = requestIdFor(req);
    context.endpoint = std::string{req->path()};
    ScopedLogContext scoped(context);

    try {
        const auto request = buildRouteRequest(req, context.requestId);
        const auto result = gateway.router().route(request);
        recordRouteMetrics(req, result);

        auto routed = currentLogContext();
        routed.subscription = result.subscriptionId;
        routed.backend = result.backend;
        updateLogContext(routed);
        if (!result.ok()) {
            LOG_INFO << "Route rejected: " << std::string(routing::reasonFor(result.outcome)) << " " << result.message;
        }
        return buildRouteResponse(result);
    } catch (const std::exception &ex) {
        LOG_ERROR << "Unhandled error while routing: " << ex.what();
        return internalErrorResponse();
    }
}

void registerRouteEndpoint(drogon::HttpAppFramework &app, Gateway &gateway, const std::string &path) {
    app.registerHandler(
        path,
        [&gateway](const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
            gateway.dispatch([&gateway, req, callback = std::move(callback)]() {
                callback(routeAndRespond(gateway, req));
            });
        },
        {drogon::Post, kRequestIdFilter});
}

}  // namespace

void HttpServer::registerRoutes(Gateway &gateway) {
    auto &app = drogon::app();
    registerRouteEndpoint(app, gateway, "/v1/route");
    registerRouteEndpoint(app, gateway, "/v1/chat/completions");
}

std::string requestIdFor(const drogon::HttpRequestPtr &req) {
    auto attributes = req->attributes();
    if (attributes) {
        try {
            return attributes->get<std::string>("request_id");
        } catch (const std::exception &) {
        }
    }
    return req->getHeader("X-Request-ID");
}

std::string extractApiKey(const drogon::HttpRequestPtr &req) {
    const auto authorization = trim(req->getHeader("Authorization"));
    if (startsWithIgnoreCase(authorization, kBearerPrefix)) {
        auto key = trim(authorization.substr(kBearerPrefix.size()));
        if (!key.empty()) {
            return key;
        }
    }
    return trim(req->getHeader("X-API-Key"));
}

routing::RouteRequest buildRouteRequest(const drogon::HttpRequestPtr &req, const std::string &requestId) {
    routing::RouteRequest request;
    request.apiKey = extractApiKey(req);
    request.requestId = requestId;
    request.payload = parseBody(req);

    request.mode = stringField(request.payload, "mode");
    if (!request.mode.has_value()) {
        request.mode = headerField(req, "X-Routing-Mode");
    }
    request.sessionId = stringField(request.payload, "session_id");
    if (!request.sessionId.has_value()) {
        request.sessionId = headerField(req, "X-Session-ID");
    }
    return request;
}

drogon::HttpResponsePtr buildRouteResponse(const routing::RouteResult &result) {
    auto response = drogon::HttpResponse::newHttpJsonResponse(result.toJson());
    response->setStatusCode(static_cast<drogon::HttpStatusCode>(result.status()));
    if (result.outcome == routing::RouteOutcome::RateLimited || result.outcome == routing::RouteOutcome::QuotaExceeded) {
        if (result.retryAfter.count() > 0) {
            const auto seconds = std::max<long long>(1, (result.retryAfter.count() + 999) / 1000);
            response->addHeader("Retry-After", std::to_string(seconds));
        }
    }
    if (result.ok()) {
        response->addHeader("X-Routed-Backend", result.backend);
    }
    return response;
}

void recordRouteMetrics(const drogon::HttpRequestPtr &req, const routing::RouteResult &result) {
    auto &registry = core::MetricsRegistry::instance();
    registry.recordRouteOutcome(std::string(routing::reasonFor(result.outcome)), result.fallback, result.attempted.size());
    if (result.outcome == routing::RouteOutcome::QuotaExceeded || result.outcome == routing::RouteOutcome::RateLimited) {
        registry.incrementAdmissionRejection(std::string(routing::reasonFor(result.outcome)));
    }

    auto observation = observationFor(req);
    if (!observation) {
        return;
    }
    if (!result.backend.empty()) {
        observation->setBackend(result.backend);
    }
    observation->addTokensIn(result.tokensIn);
    if (auto attributes = req->attributes()) {
        attributes->insert("observability.tokens_out", result.tokensOut);
    }
}

}  // namespace llmgate::http
