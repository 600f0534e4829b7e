#include "core/Metrics.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <shared_mutex>
#include <sstream>
#include <utility>

namespace llmgate::core {

namespace {
constexpr std::array<double, 12> kDefaultBuckets{5.0, 10.0, 25.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0, 10000.0, 30000.0};

std::string formatDouble(double value) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(6);
    oss << value;
    return oss.str();
}

}  // namespace

MetricsRegistry &MetricsRegistry::instance() {
    static MetricsRegistry instance;
    return instance;
}

MetricsRegistry::MetricsRegistry() = default;

std::shared_ptr<RequestObservation> MetricsRegistry::startRequest(std::string endpoint,
                                                                  std::uint64_t bytesIn,
                                                                  std::uint64_t tokensIn) {
    return std::make_shared<RequestObservation>(*this, std::move(endpoint), bytesIn, tokensIn);
}

void MetricsRegistry::incrementError(const std::string &backend,
                                     const std::string &endpoint,
                                     const std::string &errorType) {
    if (errorType.empty()) {
        return;
    }
    const SeriesKey key{backend, endpoint};
    std::unique_lock lock(mutex_);
    auto &series = metricsBySeries_[key];
    if (series.latency.buckets.empty()) {
        series.latency = createHistogram();
    }
    ++series.errorCounts[errorType];
}

void MetricsRegistry::recordRouteOutcome(const std::string &reason, bool fallback, std::size_t attempts) {
    std::unique_lock lock(mutex_);
    ++routeOutcomes_[reason];
    if (fallback) {
        ++fallbacksTotal_;
    }
    backendAttemptsTotal_ += attempts;
}

void MetricsRegistry::incrementAdmissionRejection(const std::string &reason) {
    std::unique_lock lock(mutex_);
    ++admissionRejections_[reason];
}

void MetricsRegistry::reset() {
    std::unique_lock lock(mutex_);
    metricsBySeries_.clear();
    routeOutcomes_.clear();
    admissionRejections_.clear();
    fallbacksTotal_ = 0;
    backendAttemptsTotal_ = 0;
}

void MetricsRegistry::recordRequest(const SeriesKey &key,
                                    double latencyMs,
                                    std::uint64_t bytesIn,
                                    std::uint64_t bytesOut,
                                    std::uint64_t tokensIn,
                                    std::uint64_t tokensOut,
                                    const std::string &errorType) {
    std::unique_lock lock(mutex_);
    auto &series = metricsBySeries_[key];
    if (series.latency.buckets.empty()) {
        series.latency = createHistogram();
    }

    ++series.requestsTotal;
    series.bytesIn += bytesIn;
    series.bytesOut += bytesOut;
    series.tokensIn += tokensIn;
    series.tokensOut += tokensOut;

    auto &histogram = series.latency;
    auto &counts = histogram.counts;
    bool bucketed = false;
    for (std::size_t i = 0; i < histogram.buckets.size(); ++i) {
        if (latencyMs <= histogram.buckets[i]) {
            ++counts[i];
            bucketed = true;
            break;
        }
    }
    if (!bucketed) {
        ++counts.back();
    }
    histogram.sum += latencyMs;
    ++histogram.totalCount;

    if (!errorType.empty()) {
        ++series.errorCounts[errorType];
    }
}

MetricsRegistry::Histogram MetricsRegistry::createHistogram() {
    Histogram histogram;
    histogram.buckets.assign(kDefaultBuckets.begin(), kDefaultBuckets.end());
    histogram.counts.assign(histogram.buckets.size() + 1, 0);
    return histogram;
}

std::string MetricsRegistry::escapeLabel(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '\\':
            case '\"':
                escaped.push_back('\\');
                escaped.push_back(ch);
                break;
            case '\n':
                escaped.append("\\n");
                break;
            default:
                escaped.push_back(ch);
                break;
        }
    }
    return escaped;
}

std::string MetricsRegistry::renderPrometheus() const {
    std::ostringstream oss;
    oss << "# HELP llmgate_requests_total Total number of HTTP requests handled.\n";
    oss << "# TYPE llmgate_requests_total counter\n";
    oss << "# HELP llmgate_errors_total Total number of error responses by type.\n";
    oss << "# TYPE llmgate_errors_total counter\n";
    oss << "# HELP llmgate_latency_ms Request latency in milliseconds.\n";
    oss << "# TYPE llmgate_latency_ms histogram\n";
    oss << "# HELP llmgate_bytes_in Total bytes received.\n";
    oss << "# TYPE llmgate_bytes_in counter\n";
    oss << "# HELP llmgate_bytes_out Total bytes sent.\n";
    oss << "# TYPE llmgate_bytes_out counter\n";
    oss << "# HELP llmgate_tokens_in Total prompt tokens reported by backends.\n";
    oss << "# TYPE llmgate_tokens_in counter\n";
    oss << "# HELP llmgate_tokens_out Total completion tokens reported by backends.\n";
    oss << "# TYPE llmgate_tokens_out counter\n";

    std::shared_lock lock(mutex_);
    for (const auto &[key, series] : metricsBySeries_) {
        const auto labels = "backend=\"" + escapeLabel(key.backend) + "\",endpoint=\"" + escapeLabel(key.endpoint) + "\"";
        oss << "llmgate_requests_total{" << labels << "} " << series.requestsTotal << "\n";
        oss << "llmgate_bytes_in{" << labels << "} " << series.bytesIn << "\n";
        oss << "llmgate_bytes_out{" << labels << "} " << series.bytesOut << "\n";
        oss << "llmgate_tokens_in{" << labels << "} " << series.tokensIn << "\n";
        oss << "llmgate_tokens_out{" << labels << "} " << series.tokensOut << "\n";

        for (const auto &[errorType, count] : series.errorCounts) {
            oss << "llmgate_errors_total{" << labels << ",type=\"" << escapeLabel(errorType) << "\"} " << count << "\n";
        }

        const auto &histogram = series.latency;
        if (!histogram.buckets.empty()) {
            std::uint64_t cumulative = 0;
            for (std::size_t i = 0; i < histogram.buckets.size(); ++i) {
                cumulative += histogram.counts[i];
                oss << "llmgate_latency_ms_bucket{" << labels << ",le=\"" << formatDouble(histogram.buckets[i]) << "\"} "
                    << cumulative << "\n";
            }
            cumulative += histogram.counts.back();
            oss << "llmgate_latency_ms_bucket{" << labels << ",le=\"+Inf\"} " << cumulative << "\n";
            oss << "llmgate_latency_ms_sum{" << labels << "} " << formatDouble(histogram.sum) << "\n";
            oss << "llmgate_latency_ms_count{" << labels << "} " << histogram.totalCount << "\n";
        }
    }

    oss << "# HELP llmgate_route_outcomes_total Routed requests by outcome.\n";
    oss << "# TYPE llmgate_route_outcomes_total counter\n";
    for (const auto &[reason, count] : routeOutcomes_) {
        oss << "llmgate_route_outcomes_total{outcome=\"" << escapeLabel(reason) << "\"} " << count << "\n";
    }
    oss << "# HELP llmgate_admission_rejections_total Requests rejected by quota or rate admission.\n";
    oss << "# TYPE llmgate_admission_rejections_total counter\n";
    for (const auto &[reason, count] : admissionRejections_) {
        oss << "llmgate_admission_rejections_total{reason=\"" << escapeLabel(reason) << "\"} " << count << "\n";
    }
    oss << "# HELP llmgate_fallbacks_total Requests served by a fallback backend.\n";
    oss << "# TYPE llmgate_fallbacks_total counter\n";
    oss << "llmgate_fallbacks_total " << fallbacksTotal_ << "\n";
    oss << "# HELP llmgate_backend_attempts_total Backend calls made while routing.\n";
    oss << "# TYPE llmgate_backend_attempts_total counter\n";
    oss << "llmgate_backend_attempts_total " << backendAttemptsTotal_ << "\n";

    return oss.str();
}

RequestObservation::RequestObservation(MetricsRegistry &registry,
                                       std::string endpoint,
                                       std::uint64_t bytesIn,
                                       std::uint64_t tokensIn)
    : registry_(registry),
      endpoint_(std::move(endpoint)),
      bytesIn_(bytesIn),
      tokensIn_(tokensIn),
      tokensOut_(0),
      start_(std::chrono::steady_clock::now()) {}

RequestObservation::~RequestObservation() {
    if (!completed_.load(std::memory_order_acquire)) {
        complete(0, 0, tokensOut(), "abandoned");
    }
}

void RequestObservation::complete(unsigned statusCode,
                                  std::uint64_t bytesOut,
                                  std::uint64_t tokensOut,
                                  const std::string &errorType) {
    bool expected = false;
    if (!completed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    latencyMs_ = std::chrono::duration<double, std::milli>(now - start_).count();
    statusCode_ = statusCode;

    const bool isErrorStatus = statusCode >= 400;
    std::string resolvedErrorType = errorType;
    if (resolvedErrorType.empty() && isErrorStatus) {
        if (statusCode >= 500) {
            resolvedErrorType = "http_5xx";
        } else {
            resolvedErrorType = "http_4xx";
        }
    }

    tokensOut_.store(tokensOut, std::memory_order_release);

    MetricsRegistry::SeriesKey key{backend(), endpoint_};
    registry_.recordRequest(key,
                            latencyMs_,
                            bytesIn_,
                            bytesOut,
                            tokensIn_.load(std::memory_order_acquire),
                            tokensOut_.load(std::memory_order_acquire),
                            resolvedErrorType);
}

double RequestObservation::latencyMs() const {
    return latencyMs_;
}

void RequestObservation::setBackend(std::string backend) {
    std::lock_guard lock(backendMutex_);
    backend_ = std::move(backend);
}

std::string RequestObservation::backend() const {
    std::lock_guard lock(backendMutex_);
    return backend_;
}

void RequestObservation::addTokensOut(std::uint64_t count) {
    tokensOut_.fetch_add(count, std::memory_order_relaxed);
}

void RequestObservation::addTokensIn(std::uint64_t count) {
    tokensIn_.fetch_add(count, std::memory_order_relaxed);
}

}  // namespace llmgate::core
