#include "core/UtcCalendar.hpp"

#include <ctime>

namespace llmgate::core {
namespace {

std::tm toUtc(SystemClock::time_point now) {
    const std::time_t tt = SystemClock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return tm;
}

std::string format(SystemClock::time_point now, const char *pattern) {
    const auto tm = toUtc(now);
    char buffer[16];
    const auto written = std::strftime(buffer, sizeof(buffer), pattern, &tm);
    return std::string(buffer, written);
}

std::chrono::seconds secondsUntil(SystemClock::time_point now, std::tm boundary) {
    const auto target = SystemClock::from_time_t(timegm(&boundary));
    const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(target - now);
    return remaining.count() < 1 ? std::chrono::seconds(1) : remaining;
}

}  // namespace

std::string utcDate(SystemClock::time_point now) {
    return format(now, "%Y-%m-%d");
}

std::string utcMonth(SystemClock::time_point now) {
    return format(now, "%Y-%m");
}

std::chrono::seconds secondsUntilUtcMidnight(SystemClock::time_point now) {
    auto boundary = toUtc(now);
    boundary.tm_hour = 0;
    boundary.tm_min = 0;
    boundary.tm_sec = 0;
    boundary.tm_mday += 1;
    return secondsUntil(now, boundary);
}

std::chrono::seconds secondsUntilNextUtcMonth(SystemClock::time_point now) {
    auto boundary = toUtc(now);
    boundary.tm_hour = 0;
    boundary.tm_min = 0;
    boundary.tm_sec = 0;
    boundary.tm_mday = 1;
    boundary.tm_mon += 1;
    return secondsUntil(now, boundary);
}

}  // namespace llmgate::core
