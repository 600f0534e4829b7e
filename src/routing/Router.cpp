#include "routing/Router.hpp"

#include "llmgate/logging.h"

#include <trantor/utils/Logger.h>

#include <algorithm>

namespace llmgate::routing {
namespace {

double elapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

std::string contentText(const Json::Value &content) {
    if (content.isString()) {
        return content.asString();
    }
    std::string text;
    if (content.isArray()) {
        for (const auto &part : content) {
            if (part.isObject() && part["text"].isString()) {
                if (!text.empty()) {
                    text.push_back(' ');
                }
                text += part["text"].asString();
            }
        }
    }
    return text;
}

std::string describe(const providers::ProviderError &error) {
    return error.provider + ": " + error.code + (error.message.empty() ? "" : " (" + error.message + ")");
}

}  // namespace

int httpStatusFor(RouteOutcome outcome) {
    switch (outcome) {
        case RouteOutcome::Succeeded:
            return 200;
        case RouteOutcome::InvalidRequest:
            return 400;
        case RouteOutcome::Unauthorized:
            return 401;
        case RouteOutcome::QuotaExceeded:
        case RouteOutcome::RateLimited:
            return 429;
        case RouteOutcome::NoAvailableBackends:
        case RouteOutcome::AllBackendsFailed:
            return 503;
        case RouteOutcome::InternalError:
            return 500;
    }
    return 500;
}

std::string_view reasonFor(RouteOutcome outcome) {
    switch (outcome) {
        case RouteOutcome::Succeeded:
            return "ok";
        case RouteOutcome::InvalidRequest:
            return "invalid_request";
        case RouteOutcome::Unauthorized:
            return "unauthorized";
        case RouteOutcome::QuotaExceeded:
            return "quota_exceeded";
        case RouteOutcome::RateLimited:
            return "rate_limited";
        case RouteOutcome::NoAvailableBackends:
            return "no_available_models";
        case RouteOutcome::AllBackendsFailed:
            return "all_models_failed";
        case RouteOutcome::InternalError:
            return "internal_error";
    }
    return "internal_error";
}

Json::Value RouteResult::toJson() const {
    Json::Value json(Json::objectValue);
    json["status"] = status();
    if (quotaRemaining >= 0) {
        json["quota_remaining"] = static_cast<Json::Int64>(quotaRemaining);
    }

    if (!ok()) {
        json["error"] = std::string(reasonFor(outcome));
        json["message"] = message;
        if (retryAfter.count() > 0) {
            json["retry_after_ms"] = static_cast<Json::Int64>(retryAfter.count());
        }
        return json;
    }

    json["model"] = backend;
    json["response"] = response;
    json["latency_ms"] = latencyMs;
    json["total_time_ms"] = totalTimeMs;
    json["cost_units"] = static_cast<Json::Int64>(costUnits);
    json["fallback"] = fallback;
    json["session_affinity"] = sessionAffinity;
    if (taskComplexity.has_value()) {
        json["task_complexity"] = std::string(toString(*taskComplexity));
    }
    if (mode.has_value()) {
        json["smart_mode"] = std::string(toString(*mode));
        Json::Value weights(Json::objectValue);
        for (const auto &[name, weight] : modeWeights) {
            weights[name] = weight;
        }
        json["mode_weights_applied"] = weights;
    }
    return json;
}

Router::Router(RouterServices services) : services_(services) {}

RouteResult Router::route(const RouteRequest &request) {
    const auto started = std::chrono::steady_clock::now();
    RouteResult result;
    try {
        result = dispatch(request, started);
    } catch (const std::exception &ex) {
        LOG_ERROR << "Routing failed with an internal error: " << ex.what();
        result = RouteResult{};
        result.outcome = RouteOutcome::InternalError;
        result.message = "Internal routing error";
    }
    result.totalTimeMs = elapsedMs(started);
    return result;
}

RouteResult Router::dispatch(const RouteRequest &request, std::chrono::steady_clock::time_point started) {
    RouteResult result;

    const auto subscription = services_.resolver.resolve(request.apiKey);
    if (!subscription.has_value()) {
        result.outcome = RouteOutcome::Unauthorized;
        result.message = "Invalid or expired API key";
        return result;
    }
    result.subscriptionId = subscription->subscriptionId;
    updateLogContext(LogContext{.subscription = subscription->subscriptionId});

    std::string error;
    const auto prompt = extractPrompt(request.payload, error);
    if (!prompt.has_value()) {
        result.outcome = RouteOutcome::InvalidRequest;
        result.message = error;
        return result;
    }
    const auto costUnits = extractCostUnits(request.payload, error);
    if (!costUnits.has_value()) {
        result.outcome = RouteOutcome::InvalidRequest;
        result.message = error;
        return result;
    }
    result.costUnits = *costUnits;

    if (request.mode.has_value() && !request.mode->empty()) {
        result.mode = parseRoutingMode(*request.mode);
        if (!result.mode.has_value()) {
            result.outcome = RouteOutcome::InvalidRequest;
            result.message = "Unknown routing mode '" + *request.mode + "'";
            return result;
        }
    } else if (!subscription->smartRouting.defaultMode.empty()) {
        result.mode = parseRoutingMode(subscription->smartRouting.defaultMode);
        if (!result.mode.has_value()) {
            LOG_WARN << "Plan " << subscription->planId << " has unknown default mode '"
                     << subscription->smartRouting.defaultMode << "'; plan weights apply";
        }
    }

    const auto admission = services_.admission.admit(*subscription, *costUnits);
    result.quotaRemaining = admission.quotaRemaining;
    if (!admission.allowed()) {
        result.outcome = admission.decision == AdmissionDecision::QuotaExceeded ? RouteOutcome::QuotaExceeded
                                                                                 : RouteOutcome::RateLimited;
        result.retryAfter = admission.retryAfter;
        result.message = admission.decision == AdmissionDecision::QuotaExceeded ? "Daily quota exhausted"
                                                                                 : "Rate limit exceeded";
        return result;
    }

    const auto complexity = classify(*subscription, *prompt);
    result.taskComplexity = complexity;
    if (result.mode.has_value()) {
        result.modeWeights = services_.modes.weights(*result.mode, complexity);
    }

    const auto candidates = loadCandidates(*subscription);
    const auto &smart = subscription->smartRouting;
    const bool affinityEnabled = request.sessionId.has_value() && !request.sessionId->empty() && smart.enableSessionContinuity;

    std::optional<store::BackendProfile> primary;
    if (affinityEnabled) {
        const auto decision =
            services_.affinity.observe(*request.sessionId, prompt->prompt, smart.correlationThreshold, smart.sessionTtl);
        if (decision.pinnedBackend.has_value()) {
            auto pinned = std::find_if(candidates.begin(), candidates.end(), [&](const store::BackendProfile &backend) {
                return backend.name == *decision.pinnedBackend;
            });
            if (pinned != candidates.end() && pinned->eligible()) {
                primary = *pinned;
                result.sessionAffinity = true;
                LOG_DEBUG << "Session " << *request.sessionId << " continues on " << pinned->name << " (similarity "
                          << decision.similarity << ")";
            } else {
                LOG_DEBUG << "Pinned backend " << *decision.pinnedBackend << " no longer usable; re-scoring";
                services_.affinity.release(*request.sessionId);
            }
        }
    }

    if (!primary.has_value()) {
        auto weights = subscription->costWeights;
        if (result.mode.has_value()) {
            weights = overrideCostWeights(weights, result.modeWeights);
        }
        auto selected = services_.scorer.select(candidates, subscription->priorityScore, weights);
        if (!selected.has_value()) {
            result.outcome = RouteOutcome::NoAvailableBackends;
            result.message = "All models are down or unavailable";
            return result;
        }
        LOG_DEBUG << "Selected " << selected->backend.name << " with score " << selected->score;
        primary = std::move(selected->backend);
    }

    auto attempt = call(*primary, request, *subscription);
    result.attempted.push_back(primary->name);
    if (attempt.result.ok()) {
        completeSuccess(result, request, *subscription, *primary, attempt);
        return result;
    }

    const auto primaryError = describe(*attempt.result.error);
    LOG_WARN << "Primary backend failed: " << primaryError;

    for (const auto &candidate : candidates) {
        if (candidate.name == primary->name || !candidate.eligible()) {
            continue;
        }
        auto fallbackAttempt = call(candidate, request, *subscription);
        result.attempted.push_back(candidate.name);
        if (fallbackAttempt.result.ok()) {
            result.fallback = true;
            completeSuccess(result, request, *subscription, candidate, fallbackAttempt);
            LOG_INFO << "Fallback to " << candidate.name << " succeeded after " << result.attempted.size() << " attempts";
            return result;
        }
        LOG_WARN << "Fallback backend failed: " << describe(*fallbackAttempt.result.error);
    }

    result.outcome = RouteOutcome::AllBackendsFailed;
    result.backend = primary->name;
    result.message = primaryError;
    result.latencyMs = elapsedMs(started);
    services_.stats.recordOutcome(primary->name, false, std::nullopt);
    emitUsage(request, *subscription, result, UsageStatus::Failed, primaryError);
    return result;
}

std::optional<Router::PromptInfo> Router::extractPrompt(const Json::Value &payload, std::string &error) {
    if (!payload.isObject()) {
        error = "Request body must be a JSON object";
        return std::nullopt;
    }
    const auto &messages = payload["messages"];
    if (!messages.isArray() || messages.empty()) {
        error = "No messages provided";
        return std::nullopt;
    }

    std::optional<std::string> lastUser;
    std::size_t characters = 0;
    for (const auto &message : messages) {
        if (!message.isObject()) {
            continue;
        }
        auto text = contentText(message["content"]);
        characters += text.size();
        if (message["role"].asString() == "user") {
            lastUser = std::move(text);
        }
    }
    if (!lastUser.has_value()) {
        error = "No user message found";
        return std::nullopt;
    }
    return PromptInfo{std::move(*lastUser), characters / 4};
}

std::optional<std::int64_t> Router::extractCostUnits(const Json::Value &payload, std::string &error) {
    if (!payload.isMember("cost_units")) {
        return 1;
    }
    const auto &value = payload["cost_units"];
    if (!value.isIntegral() || value.asInt64() <= 0) {
        error = "cost_units must be a positive integer";
        return std::nullopt;
    }
    return value.asInt64();
}

Json::Value Router::upstreamPayload(const Json::Value &payload, const store::BackendProfile &backend) {
    Json::Value upstream = payload;
    upstream.removeMember("mode");
    upstream.removeMember("session_id");
    upstream.removeMember("cost_units");
    if (!backend.upstreamModel.empty()) {
        upstream["model"] = backend.upstreamModel;
    }
    return upstream;
}

TaskComplexity Router::classify(const SubscriptionContext &subscription, const PromptInfo &prompt) const {
    if (!subscription.smartRouting.enableComplexityDetection) {
        return TaskComplexity::Simple;
    }
    try {
        return services_.classifier.classify(prompt.prompt, prompt.approxTokens);
    } catch (const std::exception &ex) {
        LOG_WARN << "Task classification failed, treating request as simple: " << ex.what();
        return TaskComplexity::Simple;
    }
}

std::vector<store::BackendProfile> Router::loadCandidates(const SubscriptionContext &subscription) const {
    std::vector<store::BackendProfile> candidates;
    candidates.reserve(subscription.allowedBackends.size());
    for (const auto &name : subscription.allowedBackends) {
        if (auto backend = services_.store.findBackend(name)) {
            candidates.push_back(std::move(*backend));
        } else {
            LOG_WARN << "Plan " << subscription.planId << " allows unknown backend " << name;
        }
    }
    return candidates;
}

Router::CallOutcome Router::call(const store::BackendProfile &backend,
                                 const RouteRequest &request,
                                 const SubscriptionContext &subscription) {
    CallOutcome outcome;
    providers::CompletionRequest completion{upstreamPayload(request.payload, backend)};
    providers::RequestContext context{request.requestId, subscription.subscriptionId};

    const auto started = std::chrono::steady_clock::now();
    try {
        outcome.result = services_.client.complete(backend, completion, context);
    } catch (const std::exception &ex) {
        providers::ProviderError error;
        error.type = "provider_error";
        error.code = "client_exception";
        error.message = ex.what();
        error.provider = backend.name;
        error.requestId = request.requestId;
        outcome.result.error = std::move(error);
    }
    outcome.latencyMs = elapsedMs(started);
    return outcome;
}

void Router::completeSuccess(RouteResult &result,
                             const RouteRequest &request,
                             const SubscriptionContext &subscription,
                             const store::BackendProfile &backend,
                             const CallOutcome &outcome) {
    const auto &completion = *outcome.result.data;
    result.outcome = RouteOutcome::Succeeded;
    result.backend = backend.name;
    result.response = completion.payload;
    result.latencyMs = outcome.latencyMs;
    result.tokensIn = completion.usage.promptTokens;
    result.tokensOut = completion.usage.completionTokens;
    updateLogContext(LogContext{.backend = backend.name});

    services_.stats.recordOutcome(backend.name, true, outcome.latencyMs);
    emitUsage(request, subscription, result, UsageStatus::Success, {});

    const auto &smart = subscription.smartRouting;
    if (request.sessionId.has_value() && !request.sessionId->empty() && smart.enableSessionContinuity) {
        services_.affinity.pin(*request.sessionId, backend.name, smart.sessionTtl);
    }

    if (services_.budget != nullptr) {
        try {
            services_.budget->recordSpend(subscription, static_cast<double>(result.costUnits) * backend.costPerUnit);
        } catch (const std::exception &ex) {
            LOG_WARN << "Budget tracking failed for " << subscription.subscriptionId << ": " << ex.what();
        }
    }
}

void Router::emitUsage(const RouteRequest &request,
                       const SubscriptionContext &subscription,
                       const RouteResult &result,
                       UsageStatus status,
                       const std::string &error) {
    UsageRecord record;
    record.requestId = request.requestId;
    record.subscriptionId = subscription.subscriptionId;
    record.customer = subscription.customer;
    record.maskedKey = subscription.maskedKey;
    record.backend = result.backend;
    record.costUnits = result.costUnits;
    record.tokensIn = result.tokensIn;
    record.tokensOut = result.tokensOut;
    record.latencyMs = result.latencyMs;
    record.status = status;
    record.errorMessage = error;
    record.priorityScore = subscription.priorityScore;
    record.timestamp = std::chrono::system_clock::now();
    try {
        services_.usage.emit(std::move(record));
    } catch (const std::exception &ex) {
        LOG_WARN << "Usage record emission failed: " << ex.what();
    }
}

}  // namespace llmgate::routing
