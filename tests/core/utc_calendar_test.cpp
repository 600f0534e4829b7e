#include "core/UtcCalendar.hpp"

#include "support/TestSupport.hpp"

#include <gtest/gtest.h>

using llmgate::testing::utcTime;

TEST(UtcCalendarTest, FormatsDateAndMonth) {
    const auto now = utcTime(2024, 2, 29, 23, 59, 59);
    EXPECT_EQ(llmgate::core::utcDate(now), "2024-02-29");
    EXPECT_EQ(llmgate::core::utcMonth(now), "2024-02");
}

TEST(UtcCalendarTest, SecondsUntilMidnightCountsDownToNextDay) {
    EXPECT_EQ(llmgate::core::secondsUntilUtcMidnight(utcTime(2024, 5, 10, 0, 0, 0)).count(), 86400);
    EXPECT_EQ(llmgate::core::secondsUntilUtcMidnight(utcTime(2024, 5, 10, 23, 0, 0)).count(), 3600);
    EXPECT_EQ(llmgate::core::secondsUntilUtcMidnight(utcTime(2024, 12, 31, 23, 59, 59)).count(), 1);
}

TEST(UtcCalendarTest, SecondsUntilNextMonthRollsOverYear) {
    EXPECT_EQ(llmgate::core::secondsUntilNextUtcMonth(utcTime(2024, 12, 31, 12, 0, 0)).count(), 12 * 3600);
    EXPECT_EQ(llmgate::core::secondsUntilNextUtcMonth(utcTime(2023, 2, 28, 0, 0, 0)).count(), 86400);
}
