#pragma once

#include <chrono>
#include <string>

namespace llmgate::core {

using SystemClock = std::chrono::system_clock;

// "YYYY-MM-DD" of the UTC day containing `now`.
std::string utcDate(SystemClock::time_point now);

// "YYYY-MM" of the UTC month containing `now`.
std::string utcMonth(SystemClock::time_point now);

// Whole seconds left until the next UTC midnight, at least one.
std::chrono::seconds secondsUntilUtcMidnight(SystemClock::time_point now);

// Whole seconds left until the first instant of the next UTC month, at least one.
std::chrono::seconds secondsUntilNextUtcMonth(SystemClock::time_point now);

}  // namespace llmgate::core
