/*
 * time_utils.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-11

Description: Local wall-clock helpers shared by the scheduler, the task
runner and the configuration store

**************************************************/

#ifndef DEQ_UTILS_TIME_UTILS_HPP
#define DEQ_UTILS_TIME_UTILS_HPP

#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace deq::utils {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Breaks a time point down into local calendar fields.
 */
auto toLocalTm(TimePoint tp) -> std::tm;

/**
 * @brief Converts local calendar fields back into a time point.
 *
 * Out-of-range fields (e.g. tm_mday = 32) are normalized the way mktime does.
 * DST is resolved by the C library (tm_isdst is forced to -1).
 */
auto fromLocalTm(std::tm tm) -> TimePoint;

/**
 * @brief Builds a local time point from its components.
 */
auto makeLocalTime(int year, int month, int day, int hour = 0, int minute = 0,
                   int second = 0) -> TimePoint;

/**
 * @brief Formats as local ISO-8601 without zone, e.g. 2025-03-01T03:00:00.
 */
auto toIsoString(TimePoint tp) -> std::string;

/**
 * @brief Formats as UTC ISO-8601 with milliseconds and a trailing Z, e.g.
 * 2025-03-01T02:00:00.125Z.
 */
auto toUtcIsoString(TimePoint tp) -> std::string;

/**
 * @brief Parses the format produced by toIsoString.
 *
 * Fractional seconds, if present, are ignored.
 * @return std::nullopt when the text is not a valid timestamp
 */
auto parseIsoString(std::string_view text) -> std::optional<TimePoint>;

/**
 * @brief Number of days in the given month (1-12), leap years included.
 */
auto daysInMonth(int year, int month) -> int;

}  // namespace deq::utils

#endif  // DEQ_UTILS_TIME_UTILS_HPP
