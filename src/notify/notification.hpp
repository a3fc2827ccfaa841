/*
 * notification.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-14

Description: Notification events raised by the status cache and the task
runner, and their rendering into title, message and severity

**************************************************/

#ifndef DEQ_NOTIFY_NOTIFICATION_HPP
#define DEQ_NOTIFY_NOTIFICATION_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace deq::notify {

enum class NotificationLevel { Info, Warning, Error, Critical };

enum class Resource { Cpu, Ram, Disk, Temperature };

struct DeviceOnline {
    std::string deviceId;
    std::string deviceName;
};

struct DeviceOffline {
    std::string deviceId;
    std::string deviceName;
};

struct ContainerStopped {
    std::string deviceId;
    std::string deviceName;
    std::string container;
};

struct HighResourceUsage {
    std::string deviceId;
    std::string deviceName;
    Resource resource{Resource::Cpu};
    double value{0.0};
    double threshold{0.0};
};

struct TaskFailed {
    std::string taskId;
    std::string taskName;
    std::string error;
};

using NotificationEvent = std::variant<DeviceOnline, DeviceOffline,
                                       ContainerStopped, HighResourceUsage,
                                       TaskFailed>;

/**
 * @brief Provider-independent rendering of an event.
 */
struct Notification {
    std::string title;
    std::string message;
    NotificationLevel level{NotificationLevel::Info};
    std::optional<std::string> deviceId;
    std::optional<std::string> deviceName;
    std::optional<std::string> containerName;
    std::chrono::system_clock::time_point createdAt{};
};

/// (name, value) pairs shown as extra fields by webhook providers.
using NotificationFields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Visitor built from one lambda per event alternative.
 */
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

[[nodiscard]] auto render(const NotificationEvent& event) -> Notification;

/**
 * @brief Device, Container and Time fields for @p notification.
 */
[[nodiscard]] auto contextFields(const Notification& notification)
    -> NotificationFields;

[[nodiscard]] auto levelName(NotificationLevel level) -> std::string_view;
[[nodiscard]] auto resourceName(Resource resource) -> std::string_view;

/**
 * @brief Short tag for log lines ("device_offline", "task_failed", ...).
 */
[[nodiscard]] auto eventKind(const NotificationEvent& event) -> std::string_view;

}  // namespace deq::notify

#endif  // DEQ_NOTIFY_NOTIFICATION_HPP
