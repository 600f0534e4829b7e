#include "llmgate/middleware/request_id.h"

#include "core/Metrics.hpp"
#include "llmgate/logging.h"

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <drogon/utils/Utilities.h>

#include <cctype>
#include <cstdint>

namespace llmgate::middleware {

namespace {

constexpr std::size_t kMaxRequestIdLength = 128;

bool acceptableRequestId(const std::string &value) {
    if (value.empty() || value.size() > kMaxRequestIdLength) {
        return false;
    }
    for (char ch : value) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '-' && ch != '_' && ch != '.') {
            return false;
        }
    }
    return true;
}

std::string resolveEndpoint(const drogon::HttpRequestPtr &req) {
    auto path = std::string{req->path()};
    if (path.empty()) {
        return "unknown";
    }
    return path;
}

}  // namespace

void RequestIdMiddleware::doFilter(const drogon::HttpRequestPtr &req,
                                   drogon::FilterCallback &&fcb,
                                   drogon::FilterChainCallback &&fccb) {
    std::string requestId = req->getHeader("X-Request-ID");
    if (!acceptableRequestId(requestId)) {
        requestId = generateRequestId();
    }

    req->attributes()->insert("request_id", requestId);
    req->addHeader("X-Request-ID", requestId);

    const auto endpoint = resolveEndpoint(req);
    const auto bodySize = static_cast<std::uint64_t>(req->bodyLength());

    auto metricsContext = core::MetricsRegistry::instance().startRequest(endpoint, bodySize);
    req->attributes()->insert("observability.metrics", metricsContext);
    req->attributes()->insert("observability.endpoint", endpoint);

    LogContext logContext{};
    logContext.requestId = requestId;
    logContext.endpoint = endpoint;
    setLogContext(logContext);

    (void)fcb;
    fccb();
}

std::string RequestIdMiddleware::generateRequestId() {
    return drogon::utils::getUuid();
}

}  // namespace llmgate::middleware
