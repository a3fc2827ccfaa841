/*
 * test_notification.cpp - Tests for event rendering and provider payloads
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "notify/channels.hpp"
#include "notify/notification.hpp"
#include "notify/settings.hpp"

using namespace deq::notify;
using json = nlohmann::json;

// ========== Rendering Tests ==========

TEST(NotificationRenderTest, DeviceOnline) {
    auto n = render(DeviceOnline{"nas", "NAS"});
    EXPECT_EQ(n.title, "🟢 NAS Online");
    EXPECT_EQ(n.message, "Device 'NAS' is back online");
    EXPECT_EQ(n.level, NotificationLevel::Info);
    EXPECT_EQ(n.deviceId, "nas");
}

TEST(NotificationRenderTest, DeviceOffline) {
    auto n = render(DeviceOffline{"nas", "NAS"});
    EXPECT_EQ(n.title, "🔴 NAS Offline");
    EXPECT_EQ(n.message, "Device 'NAS' is no longer responding");
    EXPECT_EQ(n.level, NotificationLevel::Warning);
}

TEST(NotificationRenderTest, ContainerStopped) {
    auto n = render(ContainerStopped{"nas", "NAS", "plex"});
    EXPECT_EQ(n.message, "Container 'plex' on NAS has stopped");
    EXPECT_EQ(n.containerName, "plex");
    EXPECT_EQ(n.level, NotificationLevel::Warning);
}

TEST(NotificationRenderTest, HighResourceUsageRoundsValues) {
    auto n = render(HighResourceUsage{"nas", "NAS", Resource::Ram, 93.6, 90.0});
    EXPECT_EQ(n.title, "⚠️ High RAM on NAS");
    EXPECT_EQ(n.message, "RAM usage is 94% (threshold: 90%)");
}

TEST(NotificationRenderTest, TemperatureUsesDegrees) {
    auto n = render(
        HighResourceUsage{"nas", "NAS", Resource::Temperature, 85.0, 80.0});
    EXPECT_EQ(n.message, "Temperature is 85°C (threshold: 80°C)");
}

TEST(NotificationRenderTest, TaskFailed) {
    auto n = render(TaskFailed{"t1", "Nightly backup", "timeout (1h)"});
    EXPECT_EQ(n.title, "❌ Task Failed: Nightly backup");
    EXPECT_EQ(n.message, "Scheduled task failed: timeout (1h)");
    EXPECT_EQ(n.level, NotificationLevel::Error);
    EXPECT_FALSE(n.deviceId.has_value());
}

TEST(NotificationRenderTest, EventKinds) {
    EXPECT_EQ(eventKind(DeviceOnline{}), "device_online");
    EXPECT_EQ(eventKind(DeviceOffline{}), "device_offline");
    EXPECT_EQ(eventKind(ContainerStopped{}), "container_stopped");
    EXPECT_EQ(eventKind(HighResourceUsage{}), "high_resource_usage");
    EXPECT_EQ(eventKind(TaskFailed{}), "task_failed");
}

TEST(NotificationRenderTest, ContextFields) {
    auto fields = contextFields(render(ContainerStopped{"nas", "NAS", "plex"}));
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields[0], (std::pair<std::string, std::string>{"Device", "NAS"}));
    EXPECT_EQ(fields[1].first, "Container");
    EXPECT_EQ(fields[2].first, "Time");
    EXPECT_EQ(fields[2].second.size(), 8u);
}

// ========== ntfy Tests ==========

TEST(NtfyPayloadTest, PriorityAndTagsPerLevel) {
    EXPECT_EQ(ntfyPriority(NotificationLevel::Info), 2);
    EXPECT_EQ(ntfyPriority(NotificationLevel::Warning), 3);
    EXPECT_EQ(ntfyPriority(NotificationLevel::Error), 4);
    EXPECT_EQ(ntfyPriority(NotificationLevel::Critical), 5);
    EXPECT_EQ(ntfyTags(NotificationLevel::Critical),
              (std::vector<std::string>{"rotating_light", "skull"}));
}

TEST(NtfyPayloadTest, HeadersAndUrl) {
    NtfySettings settings;
    settings.server = "https://ntfy.example.com//";
    settings.topic = "homelab";
    settings.token = "tk_secret";
    settings.clickUrl = "https://dash.local";

    auto headers =
        buildNtfyHeaders(settings, render(DeviceOffline{"nas", "NAS"}));
    EXPECT_EQ(headers["Title"], "🔴 NAS Offline");
    EXPECT_EQ(headers["Priority"], "3");
    EXPECT_EQ(headers["Tags"], "warning");
    EXPECT_EQ(headers["Click"], "https://dash.local");
    EXPECT_EQ(headers["Authorization"], "Bearer tk_secret");
    EXPECT_EQ(ntfyUrl(settings), "https://ntfy.example.com/homelab");
}

TEST(NtfyPayloadTest, NoAuthorizationWithoutToken) {
    NtfySettings settings;
    settings.topic = "homelab";
    auto headers = buildNtfyHeaders(settings, render(DeviceOnline{"a", "A"}));
    EXPECT_FALSE(headers.contains("Authorization"));
    EXPECT_FALSE(headers.contains("Click"));
}

TEST(NtfyPayloadTest, ChannelRequiresTopic) {
    NtfySettings settings;
    settings.enabled = true;
    NtfyChannel channel(settings);
    auto result = channel.send(render(DeviceOnline{"a", "A"}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), "Server and topic are required");
}

// ========== Webhook Tests ==========

TEST(WebhookPayloadTest, DiscordEmbed) {
    auto payload = buildDiscordPayload(render(TaskFailed{"t", "Backup", "x"}));
    ASSERT_TRUE(payload["embeds"].is_array());
    const auto& embed = payload["embeds"][0];
    EXPECT_EQ(embed["title"], "❌ Task Failed: Backup");
    EXPECT_EQ(embed["color"], 0xff4757);
    EXPECT_TRUE(embed["fields"][0]["inline"].get<bool>());
}

TEST(WebhookPayloadTest, SlackAttachment) {
    auto payload = buildSlackPayload(render(DeviceOnline{"nas", "NAS"}));
    const auto& attachment = payload["attachments"][0];
    EXPECT_EQ(attachment["text"], "Device 'NAS' is back online");
    EXPECT_EQ(attachment["color"], "#2ed573");
    EXPECT_EQ(attachment["fields"][0]["title"], "Device");
}

TEST(WebhookPayloadTest, GenericJson) {
    auto payload = buildGenericPayload(render(DeviceOffline{"nas", "NAS"}));
    EXPECT_EQ(payload["level"], "warning");
    EXPECT_EQ(payload["fields"][0]["name"], "Device");
    EXPECT_EQ(payload["fields"][0]["value"], "NAS");
}

TEST(WebhookPayloadTest, ChannelNames) {
    EXPECT_EQ(WebhookChannel(WebhookFlavor::Discord, "u").name(), "discord");
    EXPECT_EQ(WebhookChannel(WebhookFlavor::Slack, "u").name(), "slack");
    EXPECT_EQ(WebhookChannel(WebhookFlavor::Generic, "u").name(), "webhook");
}

// ========== Settings Tests ==========

TEST(NotificationSettingsTest, DefaultsFromEmptyObject) {
    auto settings = json::object().get<NotificationSettings>();
    EXPECT_FALSE(settings.enabled);
    EXPECT_EQ(settings.ntfy.server, "https://ntfy.sh");
    EXPECT_TRUE(settings.alerts.deviceOffline);
    EXPECT_TRUE(settings.alerts.highDisk);
}

TEST(NotificationSettingsTest, ReadsConfigKeys) {
    auto settings = json::parse(R"({
        "enabled": true,
        "ntfy": {"enabled": true, "topic": "lab", "token": null},
        "discord": {"enabled": true, "webhook_url": "https://discord/x"},
        "webhook": {"enabled": true, "url": "https://hook",
                    "headers": {"X-Key": "1"}},
        "alerts": {"high_cpu": false}
    })").get<NotificationSettings>();

    EXPECT_TRUE(settings.enabled);
    EXPECT_EQ(settings.ntfy.topic, "lab");
    EXPECT_EQ(settings.ntfy.token, "");
    EXPECT_EQ(settings.discord.webhookUrl, "https://discord/x");
    EXPECT_EQ(settings.webhook.headers.at("X-Key"), "1");
    EXPECT_FALSE(settings.alerts.highCpu);
    EXPECT_TRUE(settings.alerts.highMemory);
}

TEST(NotificationSettingsTest, MakeChannelsSkipsIncompleteProviders) {
    NotificationSettings settings;
    settings.ntfy.enabled = true;
    settings.discord.enabled = true;  // no URL
    settings.webhook.enabled = true;
    settings.webhook.url = "https://hook";
    auto channels = makeChannels(settings);
    ASSERT_EQ(channels.size(), 2u);
    EXPECT_EQ(channels[0]->name(), "ntfy");
    EXPECT_EQ(channels[1]->name(), "webhook");
}
