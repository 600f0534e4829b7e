#include "routing/UsageLog.hpp"

#include <nlohmann/json.hpp>
#include <trantor/utils/Logger.h>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace llmgate::routing {
namespace {

std::string isoTimestamp(std::chrono::system_clock::time_point timestamp) {
    using namespace std::chrono;
    const auto seconds = time_point_cast<std::chrono::seconds>(timestamp);
    const auto millis = duration_cast<milliseconds>(timestamp - seconds).count();
    const std::time_t tt = system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

}  // namespace

std::string_view toString(UsageStatus status) {
    return status == UsageStatus::Success ? "Success" : "Failed";
}

std::string UsageRecord::toJsonLine() const {
    nlohmann::json payload;
    payload["ts"] = isoTimestamp(timestamp);
    payload["request_id"] = requestId;
    payload["subscription"] = subscriptionId;
    payload["customer"] = customer;
    payload["api_key"] = maskedKey;
    payload["backend"] = backend;
    payload["cost_units"] = costUnits;
    payload["tokens_in"] = tokensIn;
    payload["tokens_out"] = tokensOut;
    payload["latency_ms"] = latencyMs;
    payload["status"] = std::string(toString(status));
    payload["error"] = errorMessage.empty() ? nlohmann::json(nullptr) : nlohmann::json(errorMessage);
    payload["priority_score"] = priorityScore;
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

JsonLinesUsageSink::JsonLinesUsageSink(const std::filesystem::path &path) : path_(path) {
    if (auto parent = path_.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    stream_.open(path_, std::ios::app);
    if (!stream_.is_open()) {
        throw std::runtime_error("cannot open usage log " + path_.string());
    }
}

void JsonLinesUsageSink::write(const UsageRecord &record) {
    stream_ << record.toJsonLine() << '\n';
    stream_.flush();
    if (!stream_) {
        stream_.clear();
        throw std::runtime_error("write to usage log " + path_.string() + " failed");
    }
}

AsyncUsageLog::AsyncUsageLog(std::shared_ptr<UsageSink> sink, std::size_t capacity)
    : sink_(std::move(sink)), capacity_(capacity) {
    if (!sink_) {
        throw std::invalid_argument("AsyncUsageLog requires a sink");
    }
    if (capacity_ == 0) {
        throw std::invalid_argument("usage queue capacity must be positive");
    }
    worker_ = std::thread([this] { run(); });
}

AsyncUsageLog::~AsyncUsageLog() {
    stop();
}

void AsyncUsageLog::emit(UsageRecord record) {
    {
        std::lock_guard lock(mutex_);
        if (!stopping_ && queue_.size() < capacity_) {
            queue_.push_back(std::move(record));
            wake_.notify_one();
            return;
        }
    }
    dropped_.fetch_add(1, std::memory_order_relaxed);
    LOG_WARN << "Usage record for subscription " << record.subscriptionId << " dropped; queue full or stopped";
}

void AsyncUsageLog::flush() {
    std::unique_lock lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void AsyncUsageLog::stop() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AsyncUsageLog::run() {
    std::unique_lock lock(mutex_);
    while (true) {
        wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            if (stopping_) {
                break;
            }
            continue;
        }

        auto record = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
        lock.unlock();

        try {
            sink_->write(record);
        } catch (const std::exception &ex) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            LOG_ERROR << "Usage sink rejected record " << record.requestId << ": " << ex.what();
        }

        lock.lock();
        busy_ = false;
        if (queue_.empty()) {
            idle_.notify_all();
        }
    }
    idle_.notify_all();
}

}  // namespace llmgate::routing
