#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace llmgate::core {

class RequestObservation;

class MetricsRegistry {
  public:
    static MetricsRegistry &instance();

    std::shared_ptr<RequestObservation> startRequest(std::string endpoint,
                                                     std::uint64_t bytesIn,
                                                     std::uint64_t tokensIn = 0);

    void incrementError(const std::string &backend,
                        const std::string &endpoint,
                        const std::string &errorType);

    // One per routed request, labelled with the outcome reason ("ok", "quota_exceeded", ...).
    void recordRouteOutcome(const std::string &reason, bool fallback, std::size_t attempts);
    void incrementAdmissionRejection(const std::string &reason);

    std::string renderPrometheus() const;

    // Forgets every series; only tests need this.
    void reset();

  private:
    friend class RequestObservation;

    struct SeriesKey {
        std::string backend;
        std::string endpoint;

        bool operator<(const SeriesKey &other) const {
            return std::tie(backend, endpoint) < std::tie(other.backend, other.endpoint);
        }
    };

    struct Histogram {
        std::vector<double> buckets;
        std::vector<std::uint64_t> counts;
        double sum{0.0};
        std::uint64_t totalCount{0};
    };

    struct SeriesMetrics {
        std::uint64_t requestsTotal{0};
        std::uint64_t bytesIn{0};
        std::uint64_t bytesOut{0};
        std::uint64_t tokensIn{0};
        std::uint64_t tokensOut{0};
        std::map<std::string, std::uint64_t> errorCounts;
        Histogram latency;
    };

    MetricsRegistry();

    void recordRequest(const SeriesKey &key,
                       double latencyMs,
                       std::uint64_t bytesIn,
                       std::uint64_t bytesOut,
                       std::uint64_t tokensIn,
                       std::uint64_t tokensOut,
                       const std::string &errorType);

    static Histogram createHistogram();

    static std::string escapeLabel(std::string_view value);

    mutable std::shared_mutex mutex_;
    std::map<SeriesKey, SeriesMetrics> metricsBySeries_;
    std::map<std::string, std::uint64_t> routeOutcomes_;
    std::map<std::string, std::uint64_t> admissionRejections_;
    std::uint64_t fallbacksTotal_{0};
    std::uint64_t backendAttemptsTotal_{0};
};

class RequestObservation : public std::enable_shared_from_this<RequestObservation> {
  public:
    RequestObservation(MetricsRegistry &registry,
                       std::string endpoint,
                       std::uint64_t bytesIn,
                       std::uint64_t tokensIn);

    ~RequestObservation();

    void complete(unsigned statusCode,
                  std::uint64_t bytesOut,
                  std::uint64_t tokensOut,
                  const std::string &errorType = "");

    double latencyMs() const;

    // The backend that served (or last failed) the request; "none" until routing picks one.
    void setBackend(std::string backend);
    std::string backend() const;

    const std::string &endpoint() const { return endpoint_; }
    unsigned statusCode() const { return statusCode_; }

    void addTokensOut(std::uint64_t count);
    void addTokensIn(std::uint64_t count);

    std::uint64_t tokensIn() const { return tokensIn_.load(std::memory_order_relaxed); }
    std::uint64_t tokensOut() const { return tokensOut_.load(std::memory_order_relaxed); }

  private:
    MetricsRegistry &registry_;
    std::string endpoint_;
    mutable std::mutex backendMutex_;
    std::string backend_{"none"};
    std::uint64_t bytesIn_;
    std::atomic<std::uint64_t> tokensIn_;
    std::atomic<std::uint64_t> tokensOut_;
    std::chrono::steady_clock::time_point start_;
    std::atomic<bool> completed_{false};
    double latencyMs_{0.0};
    unsigned statusCode_{0};
};

}  // namespace llmgate::core
