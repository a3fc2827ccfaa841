/*
 * settings.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-14

Description: "notifications" block of the configuration document

**************************************************/

#ifndef DEQ_NOTIFY_SETTINGS_HPP
#define DEQ_NOTIFY_SETTINGS_HPP

#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace deq::notify {

using json = nlohmann::json;

struct NtfySettings {
    bool enabled{false};
    std::string server{"https://ntfy.sh"};
    std::string topic;
    std::string token;
    std::string clickUrl;  ///< Opened when the notification is tapped
};

/**
 * @brief Discord or Slack incoming webhook.
 */
struct ChatWebhookSettings {
    bool enabled{false};
    std::string webhookUrl;
};

struct GenericWebhookSettings {
    bool enabled{false};
    std::string url;
    std::map<std::string, std::string> headers;
};

/**
 * @brief Per-kind switches. Online and offline transitions share
 * deviceOffline; temperature alerts follow highCpu.
 */
struct AlertToggles {
    bool deviceOffline{true};
    bool containerStopped{true};
    bool highCpu{true};
    bool highMemory{true};
    bool highDisk{true};
};

struct NotificationSettings {
    bool enabled{false};
    NtfySettings ntfy;
    ChatWebhookSettings discord;
    ChatWebhookSettings slack;
    GenericWebhookSettings webhook;
    AlertToggles alerts;
};

void to_json(json& j, const NtfySettings& s);
void from_json(const json& j, NtfySettings& s);
void to_json(json& j, const ChatWebhookSettings& s);
void from_json(const json& j, ChatWebhookSettings& s);
void to_json(json& j, const GenericWebhookSettings& s);
void from_json(const json& j, GenericWebhookSettings& s);
void to_json(json& j, const AlertToggles& s);
void from_json(const json& j, AlertToggles& s);
void to_json(json& j, const NotificationSettings& s);
void from_json(const json& j, NotificationSettings& s);

}  // namespace deq::notify

#endif  // DEQ_NOTIFY_SETTINGS_HPP
