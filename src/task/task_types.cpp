/*
 * task_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "task_types.hpp"

#include <charconv>

namespace deq::task {

namespace {

// Integer field that may also arrive as a numeric string. Anything else
// becomes -1 so that schedule validation rejects it.
auto readInt(const json& j, const char* key, int fallback) -> int {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_number_integer()) {
        return it->get<int>();
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        int value = 0;
        auto [ptr, ec] =
            std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return value;
        }
    }
    return -1;
}

auto readString(const json& j, const char* key) -> std::string {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

auto readOptionalString(const json& j, const char* key)
    -> std::optional<std::string> {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

auto readTimestamp(const json& j, const char* key)
    -> std::optional<utils::TimePoint> {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return utils::parseIsoString(it->get<std::string>());
}

auto readEndpoint(const json& j, const char* key) -> Endpoint {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) {
        return {};
    }
    return Endpoint{readString(*it, "device"), readString(*it, "path")};
}

template <typename T, typename F>
auto optionalToJson(const std::optional<T>& value, F convert) -> json {
    return value ? json(convert(*value)) : json(nullptr);
}

}  // namespace

auto taskTypeToString(TaskType type) -> std::string_view {
    switch (type) {
        case TaskType::Backup:
            return "backup";
        case TaskType::Wake:
            return "wake";
        case TaskType::Shutdown:
            return "shutdown";
        case TaskType::Unknown:
            return "unknown";
    }
    return "unknown";
}

auto taskTypeFromString(std::string_view text) -> TaskType {
    if (text == "backup") return TaskType::Backup;
    if (text == "wake") return TaskType::Wake;
    if (text == "shutdown") return TaskType::Shutdown;
    return TaskType::Unknown;
}

auto scheduleTypeToString(ScheduleType type) -> std::string_view {
    switch (type) {
        case ScheduleType::Hourly:
            return "hourly";
        case ScheduleType::Daily:
            return "daily";
        case ScheduleType::Weekly:
            return "weekly";
        case ScheduleType::Monthly:
            return "monthly";
        case ScheduleType::Unknown:
            return "unknown";
    }
    return "unknown";
}

auto scheduleTypeFromString(std::string_view text) -> ScheduleType {
    if (text == "hourly") return ScheduleType::Hourly;
    if (text == "daily") return ScheduleType::Daily;
    if (text == "weekly") return ScheduleType::Weekly;
    if (text == "monthly") return ScheduleType::Monthly;
    return ScheduleType::Unknown;
}

auto taskStatusToString(TaskStatus status) -> std::string_view {
    switch (status) {
        case TaskStatus::Success:
            return "success";
        case TaskStatus::Failed:
            return "failed";
        case TaskStatus::Skipped:
            return "skipped";
    }
    return "failed";
}

auto taskStatusFromString(std::string_view text) -> std::optional<TaskStatus> {
    if (text == "success") return TaskStatus::Success;
    if (text == "failed") return TaskStatus::Failed;
    if (text == "skipped") return TaskStatus::Skipped;
    return std::nullopt;
}

void to_json(json& j, const Task& task) {
    j = task.raw.is_object() ? task.raw : json::object();

    j["id"] = task.id;
    j["name"] = task.name;
    // Unrecognized kinds keep whatever text they were loaded with.
    if (task.type != TaskType::Unknown) {
        j["type"] = std::string(taskTypeToString(task.type));
    }
    j["enabled"] = task.enabled;

    json schedule = j.contains("schedule") && j["schedule"].is_object()
                        ? j["schedule"]
                        : json::object();
    if (task.schedule.type != ScheduleType::Unknown) {
        schedule["type"] = std::string(scheduleTypeToString(task.schedule.type));
    }
    schedule["time"] = task.schedule.time;
    schedule["day"] = task.schedule.day;
    schedule["date"] = task.schedule.date;
    j["schedule"] = std::move(schedule);

    if (task.type == TaskType::Backup || !task.source.device.empty() ||
        !task.source.path.empty()) {
        j["source"] = json{{"device", task.source.device},
                           {"path", task.source.path}};
    }
    if (task.type == TaskType::Backup || !task.dest.device.empty() ||
        !task.dest.path.empty()) {
        j["dest"] = json{{"device", task.dest.device}, {"path", task.dest.path}};
    }
    if (task.type == TaskType::Wake || task.type == TaskType::Shutdown) {
        j["target"] = task.target == TargetKind::Docker ? "docker" : "device";
    }
    if (!task.device.empty()) {
        j["device"] = task.device;
    }
    if (!task.container.empty()) {
        j["container"] = task.container;
    }

    json options = j.contains("options") && j["options"].is_object()
                       ? j["options"]
                       : json::object();
    options["delete"] = task.deleteExtraneous;
    j["options"] = std::move(options);

    j["last_run"] = optionalToJson(task.lastRun, utils::toIsoString);
    j["last_status"] = optionalToJson(task.lastStatus, [](TaskStatus s) {
        return std::string(taskStatusToString(s));
    });
    j["last_error"] = optionalToJson(task.lastError,
                                     [](const std::string& s) { return s; });
    j["last_size"] = optionalToJson(task.lastSize,
                                    [](const std::string& s) { return s; });
    j["next_run"] = optionalToJson(task.nextRun, utils::toIsoString);
}

void from_json(const json& j, Task& task) {
    task = Task{};
    task.raw = j;
    task.id = j.at("id").get<std::string>();
    task.name = readString(j, "name");
    task.type = taskTypeFromString(j.value("type", std::string{"backup"}));
    task.enabled = j.value("enabled", true);

    if (auto it = j.find("schedule"); it != j.end() && it->is_object()) {
        task.schedule.type =
            scheduleTypeFromString(it->value("type", std::string{"daily"}));
        if (auto time = it->find("time"); time != it->end()) {
            task.schedule.time = time->is_string() ? time->get<std::string>()
                                                   : std::string{};
        }
        task.schedule.day = readInt(*it, "day", 0);
        task.schedule.date = readInt(*it, "date", 1);
    }

    task.source = readEndpoint(j, "source");
    task.dest = readEndpoint(j, "dest");
    task.target = readString(j, "target") == "docker" ? TargetKind::Docker
                                                      : TargetKind::Device;
    task.device = readString(j, "device");
    task.container = readString(j, "container");

    if (auto it = j.find("options"); it != j.end() && it->is_object()) {
        task.deleteExtraneous = it->value("delete", false);
    }

    task.lastRun = readTimestamp(j, "last_run");
    if (auto status = readOptionalString(j, "last_status")) {
        task.lastStatus = taskStatusFromString(*status);
    }
    task.lastError = readOptionalString(j, "last_error");
    task.lastSize = readOptionalString(j, "last_size");
    task.nextRun = readTimestamp(j, "next_run");
}

}  // namespace deq::task
