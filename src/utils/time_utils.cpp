/*
 * time_utils.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "time_utils.hpp"

#include <format>
#include <iomanip>
#include <sstream>

namespace deq::utils {

auto toLocalTm(TimePoint tp) -> std::tm {
    std::time_t tt = Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    return tm;
}

auto fromLocalTm(std::tm tm) -> TimePoint {
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

auto makeLocalTime(int year, int month, int day, int hour, int minute,
                   int second) -> TimePoint {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return fromLocalTm(tm);
}

auto toIsoString(TimePoint tp) -> std::string {
    std::tm tm = toLocalTm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

auto toUtcIsoString(TimePoint tp) -> std::string {
    return std::format("{:%FT%T}Z",
                       std::chrono::floor<std::chrono::milliseconds>(tp));
}

auto parseIsoString(std::string_view text) -> std::optional<TimePoint> {
    if (text.empty()) {
        return std::nullopt;
    }
    std::tm tm{};
    std::istringstream iss{std::string(text)};
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    return fromLocalTm(tm);
}

auto daysInMonth(int year, int month) -> int {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30,
                                    31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

}  // namespace deq::utils
