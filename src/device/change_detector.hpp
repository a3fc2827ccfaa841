/*
 * change_detector.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-17

Description: Edge detection between consecutive device observations and
resource threshold checks

**************************************************/

#ifndef DEQ_DEVICE_CHANGE_DETECTOR_HPP
#define DEQ_DEVICE_CHANGE_DETECTOR_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "device_types.hpp"
#include "notify/dispatcher.hpp"

namespace deq::device {

/**
 * @brief Resource alerts for one stats snapshot. One event per resource
 * strictly above its threshold.
 */
auto thresholdEvents(const Device& device, const DeviceStats& stats)
    -> std::vector<notify::NotificationEvent>;

/**
 * @brief Remembers the last online flag and container states per device and
 * turns changes into notification events.
 *
 * - online/offline edges for non-host devices, once a prior value exists
 * - a container leaving "running" (entering it is silent)
 * - resource thresholds while the device is online
 *
 * The remembered state is replaced on every evaluation, whether or not the
 * dispatcher accepted the events.
 */
class ChangeDetector {
public:
    explicit ChangeDetector(
        std::shared_ptr<notify::INotificationDispatcher> dispatcher);

    /**
     * @brief Compares @p status with the previous observation of @p device,
     * records it and dispatches the resulting events.
     *
     * @return Number of events handed to the dispatcher
     */
    auto evaluate(const Device& device, const DeviceStatus& status)
        -> std::size_t;

    [[nodiscard]] auto previousOnline(const std::string& deviceId) const
        -> std::optional<bool>;
    [[nodiscard]] auto previousContainers(const std::string& deviceId) const
        -> std::optional<std::map<std::string, std::string>>;

private:
    auto detect(const Device& device, const DeviceStatus& status)
        -> std::vector<notify::NotificationEvent>;

    std::shared_ptr<notify::INotificationDispatcher> dispatcher_;
    mutable std::mutex mutex_;
    std::map<std::string, bool> previousOnline_;
    std::map<std::string, std::map<std::string, std::string>>
        previousContainers_;
};

}  // namespace deq::device

#endif  // DEQ_DEVICE_CHANGE_DETECTOR_HPP
