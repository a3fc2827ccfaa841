/*
 * notification_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "notification_manager.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

namespace deq::notify {

namespace {

auto toShared(std::vector<std::unique_ptr<INotificationChannel>> channels)
    -> std::vector<std::shared_ptr<INotificationChannel>> {
    std::vector<std::shared_ptr<INotificationChannel>> shared;
    shared.reserve(channels.size());
    for (auto& channel : channels) {
        if (channel) {
            shared.emplace_back(std::move(channel));
        }
    }
    return shared;
}

auto toggleFor(const AlertToggles& toggles, const NotificationEvent& event)
    -> bool {
    return std::visit(
        Overloaded{
            [&](const DeviceOnline&) { return toggles.deviceOffline; },
            [&](const DeviceOffline&) { return toggles.deviceOffline; },
            [&](const ContainerStopped&) { return toggles.containerStopped; },
            [&](const HighResourceUsage& usage) {
                switch (usage.resource) {
                    case Resource::Cpu:
                    case Resource::Temperature:
                        return toggles.highCpu;
                    case Resource::Ram:
                        return toggles.highMemory;
                    case Resource::Disk:
                        return toggles.highDisk;
                }
                return true;
            },
            // Task failures have no toggle of their own.
            [](const TaskFailed&) { return true; }},
        event);
}

auto sendThrough(INotificationChannel& channel,
                 const Notification& notification) -> ChannelOutcome {
    ChannelOutcome outcome{std::string(channel.name()), false, {}};
    try {
        auto result = channel.send(notification);
        if (result) {
            outcome.success = true;
        } else {
            outcome.error = result.error();
        }
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }
    return outcome;
}

struct TestTarget {
    std::string_view channel;
    std::string_view label;
};

constexpr TestTarget kTestTargets[] = {{"ntfy", "ntfy"},
                                       {"discord", "Discord"},
                                       {"slack", "Slack"},
                                       {"webhook", "Webhook"}};

}  // namespace

NotificationManager::NotificationManager(NotificationSettings settings)
    : NotificationManager(settings, makeChannels(settings)) {}

NotificationManager::NotificationManager(
    NotificationSettings settings,
    std::vector<std::unique_ptr<INotificationChannel>> channels)
    : settings_(std::move(settings)), channels_(toShared(std::move(channels))) {
    spdlog::info("Notifications {} with {} channel(s)",
                 settings_.enabled ? "enabled" : "disabled", channels_.size());
}

auto NotificationManager::isEnabledFor(const NotificationEvent& event) const
    -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.enabled && toggleFor(settings_.alerts, event);
}

void NotificationManager::dispatch(const NotificationEvent& event) {
    if (!isEnabledFor(event)) {
        spdlog::debug("Notification '{}' suppressed by settings",
                      eventKind(event));
        return;
    }

    Notification notification;
    try {
        notification = render(event);
    } catch (const std::exception& e) {
        spdlog::error("Failed to render notification '{}': {}",
                      eventKind(event), e.what());
        return;
    }

    auto outcomes = deliver(notification);
    if (outcomes.empty()) {
        spdlog::debug("No notification channels configured for '{}'",
                      eventKind(event));
    }
}

auto NotificationManager::deliver(const Notification& notification)
    -> std::vector<ChannelOutcome> {
    std::vector<std::shared_ptr<INotificationChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels = channels_;
    }

    std::vector<ChannelOutcome> outcomes;
    outcomes.reserve(channels.size());
    for (const auto& channel : channels) {
        auto outcome = sendThrough(*channel, notification);

        if (outcome.success) {
            spdlog::info("Notification '{}' sent via {}", notification.title,
                         outcome.channel);
        } else {
            spdlog::warn("Notification via {} failed: {}", outcome.channel,
                         outcome.error);
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

auto NotificationManager::sendTest(std::string_view channel)
    -> std::vector<ChannelOutcome> {
    std::vector<std::shared_ptr<INotificationChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels = channels_;
    }

    Notification notification;
    notification.title = "DeQ Test";
    notification.message = "🧪 Test notification from DeQ Dashboard";
    notification.createdAt = std::chrono::system_clock::now();

    std::vector<ChannelOutcome> outcomes;
    for (const auto& target : kTestTargets) {
        if (channel != "all" && channel != target.channel) {
            continue;
        }
        auto it = std::ranges::find_if(channels, [&](const auto& c) {
            return c->name() == target.channel;
        });
        if (it == channels.end()) {
            outcomes.push_back({std::string(target.channel), false,
                                std::format("{} not configured", target.label)});
            continue;
        }

        auto outcome = sendThrough(**it, notification);
        spdlog::info("Test notification via {}: {}", outcome.channel,
                     outcome.success ? "sent" : outcome.error);
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

void NotificationManager::reload(NotificationSettings settings) {
    auto channels = toShared(makeChannels(settings));
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(settings);
    channels_ = std::move(channels);
    spdlog::info("Notification settings reloaded, {} channel(s)",
                 channels_.size());
}

auto NotificationManager::settings() const -> NotificationSettings {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

auto NotificationManager::channelCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

}  // namespace deq::notify
