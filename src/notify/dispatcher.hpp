/*
 * dispatcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-14

Description: Notification sink interface used by the core

**************************************************/

#ifndef DEQ_NOTIFY_DISPATCHER_HPP
#define DEQ_NOTIFY_DISPATCHER_HPP

#include "notification.hpp"

namespace deq::notify {

/**
 * @brief Fire-and-forget delivery of notification events.
 *
 * Implementations report delivery failures through logging. Callers still
 * guard each call, since a failing sink must never disturb state tracking.
 */
class INotificationDispatcher {
public:
    virtual ~INotificationDispatcher() = default;

    virtual void dispatch(const NotificationEvent& event) = 0;
};

/**
 * @brief Drops every event. Stands in when no dispatcher is configured.
 */
class NullNotificationDispatcher final : public INotificationDispatcher {
public:
    void dispatch(const NotificationEvent&) override {}
};

}  // namespace deq::notify

#endif  // DEQ_NOTIFY_DISPATCHER_HPP
