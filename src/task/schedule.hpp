/*
 * schedule.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-18

Description: Next-run computation for hourly, daily, weekly and monthly
schedules in local wall-clock time

**************************************************/

#ifndef DEQ_TASK_SCHEDULE_HPP
#define DEQ_TASK_SCHEDULE_HPP

#include <optional>
#include <string_view>
#include <utility>

#include "task_types.hpp"

namespace deq::task {

/**
 * @brief Splits "HH:MM" into hour and minute.
 * @throws InvalidScheduleException when the text is not a valid time of day
 */
auto parseScheduleTime(std::string_view text) -> std::pair<int, int>;

/**
 * @brief Checks the fields used by @p schedule's type.
 * @throws InvalidScheduleException
 */
void validateSchedule(const Schedule& schedule);

/**
 * @brief Earliest run time strictly after @p now.
 *
 * Seconds are always zero. A candidate equal to @p now counts as passed.
 * Monthly schedules skip months that do not have the configured date,
 * looking at most twelve months ahead.
 *
 * @return std::nullopt for disabled tasks and unknown schedule types
 * @throws InvalidScheduleException for a malformed time, weekday or date
 */
auto computeNextRun(const Task& task, utils::TimePoint now)
    -> std::optional<utils::TimePoint>;

}  // namespace deq::task

#endif  // DEQ_TASK_SCHEDULE_HPP
