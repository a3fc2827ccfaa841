/*
 * test_time_utils.cpp - Tests for local calendar helpers
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "utils/time_utils.hpp"

using namespace deq::utils;

// ========== Calendar Tests ==========

TEST(TimeUtilsTest, DaysInMonthHandlesLeapYears) {
    EXPECT_EQ(daysInMonth(2024, 2), 29);
    EXPECT_EQ(daysInMonth(2023, 2), 28);
    EXPECT_EQ(daysInMonth(1900, 2), 28);
    EXPECT_EQ(daysInMonth(2000, 2), 29);
    EXPECT_EQ(daysInMonth(2025, 4), 30);
    EXPECT_EQ(daysInMonth(2025, 12), 31);
}

TEST(TimeUtilsTest, MakeLocalTimeMatchesLocalFields) {
    auto tp = makeLocalTime(2025, 3, 14, 15, 9, 26);
    auto tm = toLocalTm(tp);
    EXPECT_EQ(tm.tm_year + 1900, 2025);
    EXPECT_EQ(tm.tm_mon + 1, 3);
    EXPECT_EQ(tm.tm_mday, 14);
    EXPECT_EQ(tm.tm_hour, 15);
    EXPECT_EQ(tm.tm_min, 9);
    EXPECT_EQ(tm.tm_sec, 26);
}

TEST(TimeUtilsTest, FromLocalTmNormalizesOverflow) {
    std::tm tm = toLocalTm(makeLocalTime(2025, 1, 31, 12, 0, 0));
    tm.tm_mday += 1;
    auto normalized = toLocalTm(fromLocalTm(tm));
    EXPECT_EQ(normalized.tm_mon + 1, 2);
    EXPECT_EQ(normalized.tm_mday, 1);
}

// ========== ISO Format Tests ==========

TEST(TimeUtilsTest, IsoStringFormat) {
    EXPECT_EQ(toIsoString(makeLocalTime(2025, 3, 1, 3, 0, 0)),
              "2025-03-01T03:00:00");
}

TEST(TimeUtilsTest, UtcIsoStringHasMillisecondsAndZone) {
    // 2025-03-01T02:00:00Z
    TimePoint tp = Clock::from_time_t(1740794400) +
                   std::chrono::milliseconds(125) +
                   std::chrono::microseconds(900);
    EXPECT_EQ(toUtcIsoString(tp), "2025-03-01T02:00:00.125Z");
}

TEST(TimeUtilsTest, ParseIsoStringAcceptsOwnFormat) {
    auto tp = makeLocalTime(2025, 7, 4, 23, 59, 1);
    auto parsed = parseIsoString(toIsoString(tp));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, tp);
}

TEST(TimeUtilsTest, ParseIsoStringIgnoresFraction) {
    auto parsed = parseIsoString("2025-07-04T10:00:00.123456");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, makeLocalTime(2025, 7, 4, 10, 0, 0));
}

TEST(TimeUtilsTest, ParseIsoStringRejectsGarbage) {
    EXPECT_FALSE(parseIsoString("").has_value());
    EXPECT_FALSE(parseIsoString("yesterday").has_value());
    EXPECT_FALSE(parseIsoString("2025-07").has_value());
}
