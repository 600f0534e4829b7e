#pragma once

#include "providers/BackendClient.hpp"
#include "routing/BudgetTracker.hpp"
#include "routing/UsageLog.hpp"
#include "store/Records.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace llmgate::testing {

class ScopedEnvVar {
   public:
    explicit ScopedEnvVar(std::string key) : key_(std::move(key)) {
        const char *value = std::getenv(key_.c_str());
        if (value != nullptr) {
            original_ = std::string(value);
        }
    }

    ~ScopedEnvVar() { restore(); }

    void set(const std::string &value) { ::setenv(key_.c_str(), value.c_str(), 1); }

    void clear() { ::unsetenv(key_.c_str()); }

    void restore() {
        if (original_.has_value()) {
            ::setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            ::unsetenv(key_.c_str());
        }
    }

   private:
    std::string key_;
    std::optional<std::string> original_;
};

// Steady clock the test moves by hand. Copies of `function()` observe later advances.
class ManualClock {
   public:
    ManualClock() : now_(std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::hours(1))) {}

    void advance(std::chrono::milliseconds delta) { *now_ += delta; }

    std::function<std::chrono::steady_clock::time_point()> function() const {
        auto now = now_;
        return [now] { return *now; };
    }

   private:
    std::shared_ptr<std::chrono::steady_clock::time_point> now_;
};

inline std::chrono::system_clock::time_point utcTime(int year, int month, int day, int hour = 0, int minute = 0, int second = 0) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

inline store::BackendProfile makeBackend(const std::string &name, double costPerUnit = 0.001) {
    store::BackendProfile backend;
    backend.name = name;
    backend.endpointUrl = "https://" + name + ".backend.test/v1/chat/completions";
    backend.upstreamModel = name + "-model";
    backend.costPerUnit = costPerUnit;
    backend.capacityScore = 80.0;
    backend.avgLatencyMs = 500.0;
    backend.auth = store::AuthStrategy::None;
    return backend;
}

inline Json::Value chatPayload(const std::string &prompt) {
    Json::Value payload(Json::objectValue);
    Json::Value message(Json::objectValue);
    message["role"] = "user";
    message["content"] = prompt;
    payload["messages"].append(message);
    return payload;
}

// Scripted backend: each backend answers from its queue, then with its default behavior.
class FakeBackendClient : public providers::BackendClient {
   public:
    struct Call {
        std::string backend;
        Json::Value payload;
        providers::RequestContext context;
    };

    void failWith(const std::string &backend, const std::string &code) { failures_[backend] = code; }

    void succeed(const std::string &backend) { failures_.erase(backend); }

    providers::ProviderResult<providers::CompletionResponse> complete(const store::BackendProfile &backend,
                                                                      const providers::CompletionRequest &request,
                                                                      const providers::RequestContext &context) override {
        {
            std::lock_guard guard(mutex_);
            calls_.push_back(Call{backend.name, request.payload, context});
        }

        providers::ProviderResult<providers::CompletionResponse> result;
        if (auto failure = failures_.find(backend.name); failure != failures_.end()) {
            providers::ProviderError error;
            error.type = "provider_error";
            error.code = failure->second;
            error.message = "scripted failure";
            error.provider = backend.name;
            error.requestId = context.requestId;
            result.error = std::move(error);
            return result;
        }

        providers::CompletionResponse response;
        response.payload["id"] = "cmpl-" + backend.name;
        response.payload["backend"] = backend.name;
        response.usage.promptTokens = 12;
        response.usage.completionTokens = 30;
        response.usage.totalTokens = 42;
        response.statusCode = 200;
        result.data = std::move(response);
        return result;
    }

    std::vector<Call> calls() const {
        std::lock_guard guard(mutex_);
        return calls_;
    }

    std::vector<std::string> calledBackends() const {
        std::vector<std::string> names;
        for (const auto &call : calls()) {
            names.push_back(call.backend);
        }
        return names;
    }

   private:
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    std::map<std::string, std::string> failures_;
};

class RecordingUsageLog : public routing::UsageLog {
   public:
    void emit(routing::UsageRecord record) override {
        std::lock_guard guard(mutex_);
        records_.push_back(std::move(record));
    }

    std::vector<routing::UsageRecord> records() const {
        std::lock_guard guard(mutex_);
        return records_;
    }

   private:
    mutable std::mutex mutex_;
    std::vector<routing::UsageRecord> records_;
};

class RecordingBudgetNotifier : public routing::BudgetNotifier {
   public:
    void notify(const routing::BudgetAlert &alert) override { alerts.push_back(alert); }

    std::vector<routing::BudgetAlert> alerts;
};

}  // namespace llmgate::testing
