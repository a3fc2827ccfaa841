/*
 * schedule.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "schedule.hpp"

#include <cctype>
#include <chrono>
#include <string>

#include "exception.hpp"

namespace deq::task {

namespace {

constexpr int kMonthlyScanLimit = 12;

auto parseNumber(std::string_view digits) -> int {
    int value = 0;
    for (char c : digits) {
        value = value * 10 + (c - '0');
    }
    return value;
}

auto allDigits(std::string_view text) -> bool {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace

auto parseScheduleTime(std::string_view text) -> std::pair<int, int> {
    auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        THROW_INVALID_SCHEDULE_EXCEPTION("Invalid schedule time '" +
                                         std::string(text) + "'");
    }
    auto hourText = text.substr(0, colon);
    auto minuteText = text.substr(colon + 1);
    if (!allDigits(hourText) || !allDigits(minuteText) ||
        hourText.size() > 2 || minuteText.size() != 2) {
        THROW_INVALID_SCHEDULE_EXCEPTION("Invalid schedule time '" +
                                         std::string(text) + "'");
    }
    int hour = parseNumber(hourText);
    int minute = parseNumber(minuteText);
    if (hour > 23 || minute > 59) {
        THROW_INVALID_SCHEDULE_EXCEPTION("Schedule time out of range '" +
                                         std::string(text) + "'");
    }
    return {hour, minute};
}

void validateSchedule(const Schedule& schedule) {
    switch (schedule.type) {
        case ScheduleType::Hourly:
        case ScheduleType::Daily:
            parseScheduleTime(schedule.time);
            break;
        case ScheduleType::Weekly:
            parseScheduleTime(schedule.time);
            if (schedule.day < 0 || schedule.day > 6) {
                THROW_INVALID_SCHEDULE_EXCEPTION(
                    "Weekly schedule day must be 0-6, got " +
                    std::to_string(schedule.day));
            }
            break;
        case ScheduleType::Monthly:
            parseScheduleTime(schedule.time);
            if (schedule.date < 1 || schedule.date > 31) {
                THROW_INVALID_SCHEDULE_EXCEPTION(
                    "Monthly schedule date must be 1-31, got " +
                    std::to_string(schedule.date));
            }
            break;
        case ScheduleType::Unknown:
            break;
    }
}

auto computeNextRun(const Task& task, utils::TimePoint now)
    -> std::optional<utils::TimePoint> {
    if (!task.enabled || task.schedule.type == ScheduleType::Unknown) {
        return std::nullopt;
    }
    validateSchedule(task.schedule);
    const auto [hour, minute] = parseScheduleTime(task.schedule.time);
    const std::tm local = utils::toLocalTm(now);

    switch (task.schedule.type) {
        case ScheduleType::Hourly: {
            std::tm tm = local;
            tm.tm_min = minute;
            tm.tm_sec = 0;
            auto next = utils::fromLocalTm(tm);
            if (next <= now) {
                next += std::chrono::hours(1);
            }
            return next;
        }
        case ScheduleType::Daily: {
            std::tm tm = local;
            tm.tm_hour = hour;
            tm.tm_min = minute;
            tm.tm_sec = 0;
            auto next = utils::fromLocalTm(tm);
            if (next <= now) {
                tm.tm_mday += 1;
                next = utils::fromLocalTm(tm);
            }
            return next;
        }
        case ScheduleType::Weekly: {
            std::tm tm = local;
            tm.tm_hour = hour;
            tm.tm_min = minute;
            tm.tm_sec = 0;
            // tm_wday already counts from Sunday = 0.
            int daysAhead = task.schedule.day - local.tm_wday;
            if (daysAhead < 0 ||
                (daysAhead == 0 && utils::fromLocalTm(tm) <= now)) {
                daysAhead += 7;
            }
            tm.tm_mday += daysAhead;
            return utils::fromLocalTm(tm);
        }
        case ScheduleType::Monthly: {
            int year = local.tm_year + 1900;
            int month = local.tm_mon + 1;
            for (int i = 0; i < kMonthlyScanLimit; ++i) {
                if (task.schedule.date <= utils::daysInMonth(year, month)) {
                    auto next = utils::makeLocalTime(
                        year, month, task.schedule.date, hour, minute, 0);
                    if (next > now) {
                        return next;
                    }
                }
                if (++month > 12) {
                    month = 1;
                    ++year;
                }
            }
            return std::nullopt;
        }
        case ScheduleType::Unknown:
            break;
    }
    return std::nullopt;
}

}  // namespace deq::task
