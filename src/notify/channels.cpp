/*
 * channels.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "channels.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

namespace deq::notify {

using json = nlohmann::json;

namespace {

std::once_flag g_curlInit;

auto collectBody(char* ptr, size_t size, size_t nmemb, void* userdata)
    -> size_t {
    // Keep at most a short excerpt for error reporting.
    auto* sink = static_cast<std::string*>(userdata);
    const auto total = size * nmemb;
    if (sink->size() < 200) {
        sink->append(ptr, std::min<size_t>(total, 200 - sink->size()));
    }
    return total;
}

auto fieldsAsJson(const NotificationFields& fields) -> json {
    json array = json::array();
    for (const auto& [name, value] : fields) {
        array.push_back(json{{"name", name}, {"value", value}});
    }
    return array;
}

}  // namespace

HttpClient::HttpClient(std::chrono::seconds timeout)
    : curl_(nullptr, curl_easy_cleanup), timeout_(timeout) {
    std::call_once(g_curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    curl_.reset(curl_easy_init());
    if (!curl_) {
        spdlog::error("Failed to initialize libcurl");
    }
}

auto HttpClient::post(const std::string& url, const std::string& body,
                      const std::map<std::string, std::string>& headers)
    -> std::expected<HttpResponse, std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!curl_) {
        return std::unexpected<std::string>("libcurl unavailable");
    }

    curl_easy_reset(curl_.get());

    struct curl_slist* headerList = nullptr;
    for (const auto& [name, value] : headers) {
        headerList =
            curl_slist_append(headerList, (name + ": " + value).c_str());
    }
    std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)>
        headerGuard(headerList, curl_slist_free_all);

    std::string response;
    curl_easy_setopt(curl_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.size()));
    curl_easy_setopt(curl_.get(), CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, collectBody);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl_.get(), CURLOPT_TIMEOUT,
                     static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl_.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_USERAGENT, "DeQ");

    CURLcode res = curl_easy_perform(curl_.get());
    if (res != CURLE_OK) {
        return std::unexpected(
            std::format("Connection failed: {}", curl_easy_strerror(res)));
    }

    HttpResponse reply;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &reply.status);
    reply.body = std::move(response);
    return reply;
}

auto ntfyPriority(NotificationLevel level) -> int {
    switch (level) {
        case NotificationLevel::Info:
            return 2;
        case NotificationLevel::Warning:
            return 3;
        case NotificationLevel::Error:
            return 4;
        case NotificationLevel::Critical:
            return 5;
    }
    return 3;
}

auto ntfyTags(NotificationLevel level) -> std::vector<std::string> {
    switch (level) {
        case NotificationLevel::Info:
            return {"information_source"};
        case NotificationLevel::Warning:
            return {"warning"};
        case NotificationLevel::Error:
            return {"x"};
        case NotificationLevel::Critical:
            return {"rotating_light", "skull"};
    }
    return {};
}

auto levelColor(NotificationLevel level) -> std::string {
    switch (level) {
        case NotificationLevel::Info:
            return "#2ed573";
        case NotificationLevel::Warning:
            return "#ffa502";
        case NotificationLevel::Error:
            return "#ff4757";
        case NotificationLevel::Critical:
            return "#a55eea";
    }
    return "#ffa502";
}

auto ntfyUrl(const NtfySettings& settings) -> std::string {
    std::string server = settings.server;
    while (!server.empty() && server.back() == '/') {
        server.pop_back();
    }
    return server + "/" + settings.topic;
}

auto buildNtfyHeaders(const NtfySettings& settings,
                      const Notification& notification)
    -> std::map<std::string, std::string> {
    std::map<std::string, std::string> headers{
        {"Title", notification.title},
        {"Priority", std::to_string(ntfyPriority(notification.level))}};

    std::string tags;
    for (const auto& tag : ntfyTags(notification.level)) {
        if (!tags.empty()) {
            tags.push_back(',');
        }
        tags += tag;
    }
    if (!tags.empty()) {
        headers["Tags"] = tags;
    }
    if (!settings.clickUrl.empty()) {
        headers["Click"] = settings.clickUrl;
    }
    if (!settings.token.empty()) {
        headers["Authorization"] = "Bearer " + settings.token;
    }
    return headers;
}

auto buildDiscordPayload(const Notification& notification) -> json {
    json embed{{"title", notification.title},
               {"description", notification.message},
               {"color", std::stoi(levelColor(notification.level).substr(1),
                                   nullptr, 16)}};
    json fields = json::array();
    for (const auto& [name, value] : contextFields(notification)) {
        fields.push_back(json{{"name", name}, {"value", value}, {"inline", true}});
    }
    embed["fields"] = std::move(fields);
    return json{{"embeds", json::array({embed})}};
}

auto buildSlackPayload(const Notification& notification) -> json {
    json attachment{{"title", notification.title},
                    {"text", notification.message},
                    {"mrkdwn_in", json::array({"text"})},
                    {"color", levelColor(notification.level)}};
    json fields = json::array();
    for (const auto& [name, value] : contextFields(notification)) {
        fields.push_back(json{{"title", name}, {"value", value}, {"short", true}});
    }
    attachment["fields"] = std::move(fields);
    return json{{"attachments", json::array({attachment})}};
}

auto buildGenericPayload(const Notification& notification) -> json {
    return json{{"title", notification.title},
                {"message", notification.message},
                {"level", std::string(levelName(notification.level))},
                {"fields", fieldsAsJson(contextFields(notification))}};
}

NtfyChannel::NtfyChannel(NtfySettings settings)
    : settings_(std::move(settings)) {}

auto NtfyChannel::send(const Notification& notification) -> SendResult {
    if (settings_.server.empty() || settings_.topic.empty()) {
        return std::unexpected<std::string>("Server and topic are required");
    }
    auto reply = http_.post(ntfyUrl(settings_), notification.message,
                            buildNtfyHeaders(settings_, notification));
    if (!reply) {
        return std::unexpected(reply.error());
    }
    if (reply->status != 200) {
        return std::unexpected(std::format("HTTP {}", reply->status));
    }
    return {};
}

WebhookChannel::WebhookChannel(WebhookFlavor flavor, std::string url,
                               std::map<std::string, std::string> headers)
    : flavor_(flavor), url_(std::move(url)), headers_(std::move(headers)) {
    headers_["Content-Type"] = "application/json";
}

auto WebhookChannel::name() const -> std::string_view {
    switch (flavor_) {
        case WebhookFlavor::Discord:
            return "discord";
        case WebhookFlavor::Slack:
            return "slack";
        case WebhookFlavor::Generic:
            return "webhook";
    }
    return "webhook";
}

auto WebhookChannel::send(const Notification& notification) -> SendResult {
    if (url_.empty()) {
        return std::unexpected<std::string>("Webhook URL is required");
    }

    json payload;
    switch (flavor_) {
        case WebhookFlavor::Discord:
            payload = buildDiscordPayload(notification);
            break;
        case WebhookFlavor::Slack:
            payload = buildSlackPayload(notification);
            break;
        case WebhookFlavor::Generic:
            payload = buildGenericPayload(notification);
            break;
    }

    auto reply = http_.post(url_, payload.dump(), headers_);
    if (!reply) {
        return std::unexpected(reply.error());
    }
    // Discord answers 204 No Content.
    if (reply->status != 200 && reply->status != 201 && reply->status != 204) {
        if (reply->body.empty()) {
            return std::unexpected(std::format("HTTP {}", reply->status));
        }
        return std::unexpected(
            std::format("HTTP {}: {}", reply->status, reply->body));
    }
    return {};
}

auto makeChannels(const NotificationSettings& settings)
    -> std::vector<std::unique_ptr<INotificationChannel>> {
    std::vector<std::unique_ptr<INotificationChannel>> channels;
    if (settings.ntfy.enabled) {
        channels.push_back(std::make_unique<NtfyChannel>(settings.ntfy));
    }
    if (settings.discord.enabled && !settings.discord.webhookUrl.empty()) {
        channels.push_back(std::make_unique<WebhookChannel>(
            WebhookFlavor::Discord, settings.discord.webhookUrl));
    }
    if (settings.slack.enabled && !settings.slack.webhookUrl.empty()) {
        channels.push_back(std::make_unique<WebhookChannel>(
            WebhookFlavor::Slack, settings.slack.webhookUrl));
    }
    if (settings.webhook.enabled && !settings.webhook.url.empty()) {
        channels.push_back(std::make_unique<WebhookChannel>(
            WebhookFlavor::Generic, settings.webhook.url,
            settings.webhook.headers));
    }
    return channels;
}

}  // namespace deq::notify
