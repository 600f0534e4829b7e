#pragma once

#include "providers/BackendClient.hpp"
#include "routing/AdmissionController.hpp"
#include "routing/BackendStats.hpp"
#include "routing/BudgetTracker.hpp"
#include "routing/CredentialResolver.hpp"
#include "routing/ModeProfiles.hpp"
#include "routing/ModelScorer.hpp"
#include "routing/SessionAffinity.hpp"
#include "routing/TaskClassifier.hpp"
#include "routing/UsageLog.hpp"
#include "store/DurableStore.hpp"

#include <json/json.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmgate::routing {

enum class RouteOutcome {
    Succeeded,
    InvalidRequest,
    Unauthorized,
    QuotaExceeded,
    RateLimited,
    NoAvailableBackends,
    AllBackendsFailed,
    InternalError,
};

int httpStatusFor(RouteOutcome outcome);
std::string_view reasonFor(RouteOutcome outcome);

struct RouteRequest {
    std::string apiKey;
    Json::Value payload{Json::objectValue};
    std::optional<std::string> mode;
    std::optional<std::string> sessionId;
    std::string requestId;
};

struct RouteResult {
    RouteOutcome outcome{RouteOutcome::InternalError};
    std::string backend;
    Json::Value response;
    double latencyMs{0.0};
    double totalTimeMs{0.0};
    std::int64_t costUnits{0};
    std::optional<TaskComplexity> taskComplexity;
    std::optional<RoutingMode> mode;
    ModeWeights modeWeights;
    bool fallback{false};
    bool sessionAffinity{false};
    std::vector<std::string> attempted;
    std::uint64_t tokensIn{0};
    std::uint64_t tokensOut{0};
    std::string message;
    std::int64_t quotaRemaining{-1};
    std::chrono::milliseconds retryAfter{0};
    std::string subscriptionId;

    [[nodiscard]] int status() const { return httpStatusFor(outcome); }
    [[nodiscard]] bool ok() const { return outcome == RouteOutcome::Succeeded; }

    Json::Value toJson() const;
};

struct RouterServices {
    CredentialResolver &resolver;
    AdmissionController &admission;
    const store::DurableStore &store;
    const ModelScorer &scorer;
    const TaskClassifier &classifier;
    const ModeProfiles &modes;
    SessionAffinity &affinity;
    providers::BackendClient &client;
    BackendStatsRecorder &stats;
    UsageLog &usage;
    BudgetTracker *budget{nullptr};
};

// Request lifecycle: resolve, admit, classify, select (affinity or scoring), call, fall back across
// the remaining allowed backends in plan order. Holds no cross-request state of its own.
class Router {
   public:
    explicit Router(RouterServices services);

    RouteResult route(const RouteRequest &request);

   private:
    struct PromptInfo {
        std::string prompt;
        std::size_t approxTokens{0};
    };

    struct CallOutcome {
        providers::ProviderResult<providers::CompletionResponse> result;
        double latencyMs{0.0};
    };

    RouteResult dispatch(const RouteRequest &request, std::chrono::steady_clock::time_point started);

    static std::optional<PromptInfo> extractPrompt(const Json::Value &payload, std::string &error);
    static std::optional<std::int64_t> extractCostUnits(const Json::Value &payload, std::string &error);
    static Json::Value upstreamPayload(const Json::Value &payload, const store::BackendProfile &backend);

    TaskComplexity classify(const SubscriptionContext &subscription, const PromptInfo &prompt) const;
    std::vector<store::BackendProfile> loadCandidates(const SubscriptionContext &subscription) const;

    CallOutcome call(const store::BackendProfile &backend, const RouteRequest &request, const SubscriptionContext &subscription);

    void completeSuccess(RouteResult &result,
                         const RouteRequest &request,
                         const SubscriptionContext &subscription,
                         const store::BackendProfile &backend,
                         const CallOutcome &outcome);
    void emitUsage(const RouteRequest &request,
                   const SubscriptionContext &subscription,
                   const RouteResult &result,
                   UsageStatus status,
                   const std::string &error);

    RouterServices services_;
};

}  // namespace llmgate::routing
