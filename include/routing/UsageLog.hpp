#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace llmgate::routing {

enum class UsageStatus {
    Success,
    Failed,
};

std::string_view toString(UsageStatus status);

struct UsageRecord {
    std::string requestId;
    std::string subscriptionId;
    std::string customer;
    std::string maskedKey;
    std::string backend;
    std::int64_t costUnits{1};
    std::uint64_t tokensIn{0};
    std::uint64_t tokensOut{0};
    double latencyMs{0.0};
    UsageStatus status{UsageStatus::Success};
    std::string errorMessage;
    int priorityScore{0};
    std::chrono::system_clock::time_point timestamp{};

    std::string toJsonLine() const;
};

// Destination for usage records; called from the usage worker thread only.
class UsageSink {
   public:
    virtual ~UsageSink() = default;

    virtual void write(const UsageRecord &record) = 0;
};

class JsonLinesUsageSink : public UsageSink {
   public:
    explicit JsonLinesUsageSink(const std::filesystem::path &path);

    void write(const UsageRecord &record) override;

   private:
    std::filesystem::path path_;
    std::ofstream stream_;
};

// What the router sees: fire-and-forget emission that never blocks on persistence.
class UsageLog {
   public:
    virtual ~UsageLog() = default;

    virtual void emit(UsageRecord record) = 0;
};

class AsyncUsageLog : public UsageLog {
   public:
    explicit AsyncUsageLog(std::shared_ptr<UsageSink> sink, std::size_t capacity = 10000);
    ~AsyncUsageLog() override;

    AsyncUsageLog(const AsyncUsageLog &) = delete;
    AsyncUsageLog &operator=(const AsyncUsageLog &) = delete;

    // Queues the record; drops it with a warning when the queue is full or the log is stopped.
    void emit(UsageRecord record) override;

    // Blocks until every record queued so far has been handed to the sink.
    void flush();

    // Drains the queue and joins the worker; further records are dropped.
    void stop();

    [[nodiscard]] std::uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t failed() const { return failed_.load(std::memory_order_relaxed); }

   private:
    void run();

    std::shared_ptr<UsageSink> sink_;
    std::size_t capacity_;
    std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::deque<UsageRecord> queue_;
    bool stopping_{false};
    bool busy_{false};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::thread worker_;
};

}  // namespace llmgate::routing
