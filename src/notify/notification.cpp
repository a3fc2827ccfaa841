/*
 * notification.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "notification.hpp"

#include <cmath>
#include <format>

#include "utils/time_utils.hpp"

namespace deq::notify {

namespace {

auto wholeNumber(double value) -> long long {
    return static_cast<long long>(std::lround(value));
}

}  // namespace

auto levelName(NotificationLevel level) -> std::string_view {
    switch (level) {
        case NotificationLevel::Info:
            return "info";
        case NotificationLevel::Warning:
            return "warning";
        case NotificationLevel::Error:
            return "error";
        case NotificationLevel::Critical:
            return "critical";
    }
    return "info";
}

auto resourceName(Resource resource) -> std::string_view {
    switch (resource) {
        case Resource::Cpu:
            return "CPU";
        case Resource::Ram:
            return "RAM";
        case Resource::Disk:
            return "Disk";
        case Resource::Temperature:
            return "Temperature";
    }
    return "CPU";
}

auto render(const NotificationEvent& event) -> Notification {
    auto notification = std::visit(
        Overloaded{
            [](const DeviceOnline& e) {
                return Notification{
                    std::format("🟢 {} Online", e.deviceName),
                    std::format("Device '{}' is back online", e.deviceName),
                    NotificationLevel::Info, e.deviceId, e.deviceName,
                    std::nullopt};
            },
            [](const DeviceOffline& e) {
                return Notification{
                    std::format("🔴 {} Offline", e.deviceName),
                    std::format("Device '{}' is no longer responding",
                                e.deviceName),
                    NotificationLevel::Warning, e.deviceId, e.deviceName,
                    std::nullopt};
            },
            [](const ContainerStopped& e) {
                return Notification{
                    "⏹️ Container Stopped",
                    std::format("Container '{}' on {} has stopped", e.container,
                                e.deviceName),
                    NotificationLevel::Warning, e.deviceId, e.deviceName,
                    e.container};
            },
            [](const HighResourceUsage& e) {
                auto name = resourceName(e.resource);
                std::string message =
                    e.resource == Resource::Temperature
                        ? std::format("{} is {}°C (threshold: {}°C)", name,
                                      wholeNumber(e.value),
                                      wholeNumber(e.threshold))
                        : std::format("{} usage is {}% (threshold: {}%)", name,
                                      wholeNumber(e.value),
                                      wholeNumber(e.threshold));
                return Notification{
                    std::format("⚠️ High {} on {}", name, e.deviceName),
                    std::move(message), NotificationLevel::Warning, e.deviceId,
                    e.deviceName, std::nullopt};
            },
            [](const TaskFailed& e) {
                return Notification{
                    std::format("❌ Task Failed: {}", e.taskName),
                    std::format("Scheduled task failed: {}", e.error),
                    NotificationLevel::Error, std::nullopt, std::nullopt,
                    std::nullopt};
            }},
        event);
    notification.createdAt = std::chrono::system_clock::now();
    return notification;
}

auto contextFields(const Notification& notification) -> NotificationFields {
    NotificationFields fields;
    if (notification.deviceName) {
        fields.emplace_back("Device", *notification.deviceName);
    } else if (notification.deviceId) {
        fields.emplace_back("Device ID", *notification.deviceId);
    }
    if (notification.containerName) {
        fields.emplace_back("Container", *notification.containerName);
    }
    auto local = utils::toLocalTm(notification.createdAt);
    fields.emplace_back("Time", std::format("{:02}:{:02}:{:02}", local.tm_hour,
                                            local.tm_min, local.tm_sec));
    return fields;
}

auto eventKind(const NotificationEvent& event) -> std::string_view {
    return std::visit(
        Overloaded{[](const DeviceOnline&) { return std::string_view{"device_online"}; },
                   [](const DeviceOffline&) { return std::string_view{"device_offline"}; },
                   [](const ContainerStopped&) { return std::string_view{"container_stopped"}; },
                   [](const HighResourceUsage&) { return std::string_view{"high_resource_usage"}; },
                   [](const TaskFailed&) { return std::string_view{"task_failed"}; }},
        event);
}

}  // namespace deq::notify
