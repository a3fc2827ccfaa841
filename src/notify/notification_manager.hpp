/*
 * notification_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-15

Description: Dispatcher that gates events on the notification settings and
fans them out to every configured channel

**************************************************/

#ifndef DEQ_NOTIFY_NOTIFICATION_MANAGER_HPP
#define DEQ_NOTIFY_NOTIFICATION_MANAGER_HPP

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "channels.hpp"
#include "dispatcher.hpp"
#include "settings.hpp"

namespace deq::notify {

struct ChannelOutcome {
    std::string channel;
    bool success{false};
    std::string error;
};

class NotificationManager : public INotificationDispatcher {
public:
    /**
     * @brief Builds the channels enabled in @p settings.
     */
    explicit NotificationManager(NotificationSettings settings);

    NotificationManager(
        NotificationSettings settings,
        std::vector<std::unique_ptr<INotificationChannel>> channels);

    /**
     * @brief Renders and delivers @p event unless disabled. Never throws.
     */
    void dispatch(const NotificationEvent& event) override;

    /**
     * @brief Sends @p notification to every channel, ignoring the gates.
     *
     * One failing channel does not prevent delivery to the others.
     */
    auto deliver(const Notification& notification)
        -> std::vector<ChannelOutcome>;

    /**
     * @brief Sends a fixed test message to @p channel ("ntfy", "discord",
     * "slack", "webhook" or "all"), ignoring every gate.
     *
     * A requested channel that is not configured yields a failed outcome
     * instead of a delivery attempt.
     */
    auto sendTest(std::string_view channel) -> std::vector<ChannelOutcome>;

    /**
     * @brief Whether @p event passes the global switch and its alert toggle.
     */
    [[nodiscard]] auto isEnabledFor(const NotificationEvent& event) const
        -> bool;

    /**
     * @brief Replaces the settings and rebuilds the channel list.
     */
    void reload(NotificationSettings settings);

    [[nodiscard]] auto settings() const -> NotificationSettings;

    [[nodiscard]] auto channelCount() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    NotificationSettings settings_;
    std::vector<std::shared_ptr<INotificationChannel>> channels_;
};

}  // namespace deq::notify

#endif  // DEQ_NOTIFY_NOTIFICATION_MANAGER_HPP
