/*
 * settings.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "settings.hpp"

namespace deq::notify {

namespace {

template <typename T>
auto sectionOr(const json& j, const char* key) -> T {
    if (auto it = j.find(key); it != j.end() && it->is_object()) {
        return it->get<T>();
    }
    return T{};
}

}  // namespace

void to_json(json& j, const NtfySettings& s) {
    j = json{{"enabled", s.enabled},
             {"server", s.server},
             {"topic", s.topic},
             {"token", s.token}};
    if (!s.clickUrl.empty()) {
        j["click_url"] = s.clickUrl;
    }
}

void from_json(const json& j, NtfySettings& s) {
    s.enabled = j.value("enabled", false);
    s.server = j.value("server", std::string{"https://ntfy.sh"});
    if (s.server.empty()) {
        s.server = "https://ntfy.sh";
    }
    s.topic = j.value("topic", std::string{});
    s.clickUrl = j.value("click_url", std::string{});
    // A null token is common in hand-edited files.
    if (auto it = j.find("token"); it != j.end() && it->is_string()) {
        s.token = it->get<std::string>();
    } else {
        s.token.clear();
    }
}

void to_json(json& j, const ChatWebhookSettings& s) {
    j = json{{"enabled", s.enabled}, {"webhook_url", s.webhookUrl}};
}

void from_json(const json& j, ChatWebhookSettings& s) {
    s.enabled = j.value("enabled", false);
    s.webhookUrl = j.value("webhook_url", std::string{});
}

void to_json(json& j, const GenericWebhookSettings& s) {
    j = json{{"enabled", s.enabled}, {"url", s.url}, {"headers", s.headers}};
}

void from_json(const json& j, GenericWebhookSettings& s) {
    s.enabled = j.value("enabled", false);
    s.url = j.value("url", std::string{});
    s.headers.clear();
    if (auto it = j.find("headers"); it != j.end() && it->is_object()) {
        for (const auto& [name, value] : it->items()) {
            if (value.is_string()) {
                s.headers[name] = value.get<std::string>();
            }
        }
    }
}

void to_json(json& j, const AlertToggles& s) {
    j = json{{"device_offline", s.deviceOffline},
             {"container_stopped", s.containerStopped},
             {"high_cpu", s.highCpu},
             {"high_memory", s.highMemory},
             {"high_disk", s.highDisk}};
}

void from_json(const json& j, AlertToggles& s) {
    s.deviceOffline = j.value("device_offline", true);
    s.containerStopped = j.value("container_stopped", true);
    s.highCpu = j.value("high_cpu", true);
    s.highMemory = j.value("high_memory", true);
    s.highDisk = j.value("high_disk", true);
}

void to_json(json& j, const NotificationSettings& s) {
    j = json{{"enabled", s.enabled}, {"ntfy", s.ntfy},
             {"discord", s.discord}, {"slack", s.slack},
             {"webhook", s.webhook}, {"alerts", s.alerts}};
}

void from_json(const json& j, NotificationSettings& s) {
    s.enabled = j.value("enabled", false);
    s.ntfy = sectionOr<NtfySettings>(j, "ntfy");
    s.discord = sectionOr<ChatWebhookSettings>(j, "discord");
    s.slack = sectionOr<ChatWebhookSettings>(j, "slack");
    s.webhook = sectionOr<GenericWebhookSettings>(j, "webhook");
    s.alerts = sectionOr<AlertToggles>(j, "alerts");
}

}  // namespace deq::notify
