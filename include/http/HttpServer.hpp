#pragma once

#include "routing/Router.hpp"

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>

#include <string>

namespace llmgate {
class Gateway;
}  // namespace llmgate

namespace llmgate::http {

// Registered class name of middleware::RequestIdMiddleware; every handler lists it as a constraint.
inline constexpr const char *kRequestIdFilter = "llmgate::middleware::RequestIdMiddleware";

class HttpServer {
  public:
    // POST /v1/route and its alias POST /v1/chat/completions. Routing runs on the gateway's
    // workers and the response is sent from there.
    static void registerRoutes(Gateway &gateway);
};

// Id stored by the request-id filter, else the raw X-Request-ID header.
std::string requestIdFor(const drogon::HttpRequestPtr &req);

// `Authorization: Bearer <key>` wins over `X-API-Key`; empty when neither is present.
std::string extractApiKey(const drogon::HttpRequestPtr &req);

// Body fields take precedence over the X-Routing-Mode / X-Session-ID headers. A body that is not
// valid JSON yields a null payload, which the router rejects after authenticating the key.
routing::RouteRequest buildRouteRequest(const drogon::HttpRequestPtr &req, const std::string &requestId);

drogon::HttpResponsePtr buildRouteResponse(const routing::RouteResult &result);

void recordRouteMetrics(const drogon::HttpRequestPtr &req, const routing::RouteResult &result);

}  // namespace llmgate::http
