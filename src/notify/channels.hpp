/*
 * channels.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-14

Description: Delivery channels for notifications: ntfy, Discord, Slack and
generic JSON webhooks over libcurl

**************************************************/

#ifndef DEQ_NOTIFY_CHANNELS_HPP
#define DEQ_NOTIFY_CHANNELS_HPP

#include <chrono>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "notification.hpp"
#include "settings.hpp"

namespace deq::notify {

using SendResult = std::expected<void, std::string>;

class INotificationChannel {
public:
    virtual ~INotificationChannel() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    virtual auto send(const Notification& notification) -> SendResult = 0;
};

struct HttpResponse {
    long status{0};
    std::string body;  ///< First 200 bytes at most
};

/**
 * @brief Minimal blocking HTTP POST client. One easy handle, serialized.
 */
class HttpClient {
public:
    explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds(10));

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief POSTs @p body. Transport failures become the error value,
     * any HTTP status is a response.
     */
    auto post(const std::string& url, const std::string& body,
              const std::map<std::string, std::string>& headers)
        -> std::expected<HttpResponse, std::string>;

private:
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
    std::chrono::seconds timeout_;
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Provider payloads
// ---------------------------------------------------------------------------

[[nodiscard]] auto ntfyPriority(NotificationLevel level) -> int;
[[nodiscard]] auto ntfyTags(NotificationLevel level) -> std::vector<std::string>;

/**
 * @brief "#rrggbb" color used by the chat webhooks.
 */
[[nodiscard]] auto levelColor(NotificationLevel level) -> std::string;

[[nodiscard]] auto buildNtfyHeaders(const NtfySettings& settings,
                                    const Notification& notification)
    -> std::map<std::string, std::string>;

[[nodiscard]] auto ntfyUrl(const NtfySettings& settings) -> std::string;

[[nodiscard]] auto buildDiscordPayload(const Notification& notification)
    -> nlohmann::json;
[[nodiscard]] auto buildSlackPayload(const Notification& notification)
    -> nlohmann::json;
[[nodiscard]] auto buildGenericPayload(const Notification& notification)
    -> nlohmann::json;

// ---------------------------------------------------------------------------
// Channels
// ---------------------------------------------------------------------------

class NtfyChannel : public INotificationChannel {
public:
    explicit NtfyChannel(NtfySettings settings);

    [[nodiscard]] auto name() const -> std::string_view override {
        return "ntfy";
    }
    auto send(const Notification& notification) -> SendResult override;

private:
    NtfySettings settings_;
    HttpClient http_;
};

enum class WebhookFlavor { Discord, Slack, Generic };

class WebhookChannel : public INotificationChannel {
public:
    WebhookChannel(WebhookFlavor flavor, std::string url,
                   std::map<std::string, std::string> headers = {});

    [[nodiscard]] auto name() const -> std::string_view override;
    auto send(const Notification& notification) -> SendResult override;

private:
    WebhookFlavor flavor_;
    std::string url_;
    std::map<std::string, std::string> headers_;
    HttpClient http_;
};

/**
 * @brief Channels enabled (and sufficiently configured) in @p settings.
 */
auto makeChannels(const NotificationSettings& settings)
    -> std::vector<std::unique_ptr<INotificationChannel>>;

}  // namespace deq::notify

#endif  // DEQ_NOTIFY_CHANNELS_HPP
