/*
 * change_detector.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "change_detector.hpp"

#include <spdlog/spdlog.h>

namespace deq::device {

using notify::NotificationEvent;
using notify::Resource;

auto thresholdEvents(const Device& device, const DeviceStats& stats)
    -> std::vector<NotificationEvent> {
    const auto alerts = device.effectiveAlerts();
    std::vector<NotificationEvent> events;

    auto check = [&](Resource resource, std::optional<double> value,
                     double threshold) {
        if (value && *value > threshold) {
            events.emplace_back(notify::HighResourceUsage{
                device.id, device.displayName(), resource, *value, threshold});
        }
    };

    check(Resource::Cpu, stats.cpu, alerts.cpu);
    check(Resource::Ram, stats.ramPercent(), alerts.ram);
    check(Resource::Disk, stats.maxDiskPercent(), alerts.diskUsage);
    check(Resource::Temperature, stats.temperature, alerts.cpuTemp);
    return events;
}

ChangeDetector::ChangeDetector(
    std::shared_ptr<notify::INotificationDispatcher> dispatcher)
    : dispatcher_(dispatcher
                      ? std::move(dispatcher)
                      : std::make_shared<notify::NullNotificationDispatcher>()) {
}

auto ChangeDetector::detect(const Device& device, const DeviceStatus& status)
    -> std::vector<NotificationEvent> {
    std::vector<NotificationEvent> events;
    const auto alerts = device.effectiveAlerts();

    std::lock_guard<std::mutex> lock(mutex_);

    if (!device.isHost) {
        const bool online = status.isOnline();
        auto previous = previousOnline_.find(device.id);
        if (previous != previousOnline_.end() && previous->second != online &&
            alerts.online) {
            if (online) {
                events.emplace_back(
                    notify::DeviceOnline{device.id, device.displayName()});
            } else {
                events.emplace_back(
                    notify::DeviceOffline{device.id, device.displayName()});
            }
        }
        previousOnline_[device.id] = online;
    }

    auto& previousContainers = previousContainers_[device.id];
    for (const auto& [name, state] : status.containers) {
        auto previous = previousContainers.find(name);
        if (previous != previousContainers.end() &&
            previous->second == kContainerRunning &&
            state != kContainerRunning) {
            events.emplace_back(notify::ContainerStopped{
                device.id, device.displayName(), name});
        }
    }
    previousContainers = status.containers;

    if (status.isOnline() && status.stats) {
        auto usage = thresholdEvents(device, *status.stats);
        events.insert(events.end(), std::make_move_iterator(usage.begin()),
                      std::make_move_iterator(usage.end()));
    }
    return events;
}

auto ChangeDetector::evaluate(const Device& device, const DeviceStatus& status)
    -> std::size_t {
    auto events = detect(device, status);
    for (const auto& event : events) {
        try {
            dispatcher_->dispatch(event);
        } catch (const std::exception& e) {
            spdlog::error("Notification '{}' for {} failed: {}",
                          notify::eventKind(event), device.id, e.what());
        }
    }
    return events.size();
}

auto ChangeDetector::previousOnline(const std::string& deviceId) const
    -> std::optional<bool> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = previousOnline_.find(deviceId);
    if (it == previousOnline_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto ChangeDetector::previousContainers(const std::string& deviceId) const
    -> std::optional<std::map<std::string, std::string>> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = previousContainers_.find(deviceId);
    if (it == previousContainers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace deq::device
