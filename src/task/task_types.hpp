/*
 * task_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-15

Description: Scheduled maintenance task records (backup, wake, shutdown)
and their JSON representation

**************************************************/

#ifndef DEQ_TASK_TASK_TYPES_HPP
#define DEQ_TASK_TASK_TYPES_HPP

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "utils/time_utils.hpp"

namespace deq::task {

using json = nlohmann::json;

enum class TaskType { Backup, Wake, Shutdown, Unknown };

enum class ScheduleType { Hourly, Daily, Weekly, Monthly, Unknown };

/// What a wake or shutdown task acts on.
enum class TargetKind { Device, Docker };

enum class TaskStatus { Success, Failed, Skipped };

struct Schedule {
    ScheduleType type{ScheduleType::Daily};
    std::string time{"03:00"};  ///< "HH:MM"; hourly uses only the minutes
    int day{0};                 ///< weekly, 0 = Sunday .. 6 = Saturday
    int date{1};                ///< monthly, 1 .. 31
};

struct Endpoint {
    std::string device;
    std::string path;
};

struct Task {
    std::string id;
    std::string name;
    TaskType type{TaskType::Backup};
    bool enabled{true};
    Schedule schedule;

    Endpoint source;  ///< backup
    Endpoint dest;    ///< backup

    TargetKind target{TargetKind::Device};  ///< wake / shutdown
    std::string device;
    std::string container;

    bool deleteExtraneous{false};  ///< options.delete

    std::optional<utils::TimePoint> lastRun;
    std::optional<TaskStatus> lastStatus;
    std::optional<std::string> lastError;
    std::optional<std::string> lastSize;
    std::optional<utils::TimePoint> nextRun;

    /// The object this task was read from; unknown keys are written back.
    json raw = json::object();

    [[nodiscard]] auto displayName() const -> const std::string& {
        return name.empty() ? id : name;
    }
};

auto taskTypeToString(TaskType type) -> std::string_view;
auto taskTypeFromString(std::string_view text) -> TaskType;
auto scheduleTypeToString(ScheduleType type) -> std::string_view;
auto scheduleTypeFromString(std::string_view text) -> ScheduleType;
auto taskStatusToString(TaskStatus status) -> std::string_view;
auto taskStatusFromString(std::string_view text) -> std::optional<TaskStatus>;

void to_json(json& j, const Task& task);
void from_json(const json& j, Task& task);

}  // namespace deq::task

#endif  // DEQ_TASK_TASK_TYPES_HPP
