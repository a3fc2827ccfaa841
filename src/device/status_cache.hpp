/*
 * status_cache.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-17

Description: Last known status of every device, refreshed in the background
with at most one refresh in flight per device

**************************************************/

#ifndef DEQ_DEVICE_STATUS_CACHE_HPP
#define DEQ_DEVICE_STATUS_CACHE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "change_detector.hpp"
#include "command/command_executor.hpp"
#include "device_types.hpp"
#include "notify/dispatcher.hpp"
#include "server/eventloop.hpp"
#include "utils/request_context.hpp"

namespace deq::device {

enum class RefreshRequest {
    Started,            ///< Work was queued
    AlreadyInProgress,  ///< A refresh for this device is still running
    Rejected            ///< The worker pool is shutting down
};

/**
 * @brief Cache of DeviceStatus keyed by device id.
 *
 * Readers never block on refresh work. A refresh observes the device through
 * the command executor, feeds the change detector and then replaces the
 * cached entry in one step. Must be owned by a std::shared_ptr, since queued
 * refreshes keep the cache alive. The worker pool is not owned: once it is
 * gone, refreshAsync() reports Rejected.
 */
class DeviceStatusCache
    : public std::enable_shared_from_this<DeviceStatusCache> {
public:
    /**
     * @param dispatcher May be null, in which case events are dropped
     * @param loop Worker pool, held weakly
     */
    DeviceStatusCache(std::shared_ptr<command::ICommandExecutor> executor,
                      std::shared_ptr<notify::INotificationDispatcher> dispatcher,
                      std::shared_ptr<app::EventLoop> loop);

    /**
     * @brief Cached status, or std::nullopt before the first refresh finished.
     */
    [[nodiscard]] auto get(const std::string& deviceId) const
        -> std::optional<DeviceStatus>;

    [[nodiscard]] auto getAll() const -> std::map<std::string, DeviceStatus>;

    /**
     * @brief Queues a refresh of @p device unless one is already running.
     *
     * Returns immediately; the device record is copied.
     */
    auto refreshAsync(const Device& device, const utils::RequestContext& ctx)
        -> RefreshRequest;

    /**
     * @brief refreshAsync for each device.
     * @return Number of refreshes actually started
     */
    auto refreshAll(const std::vector<Device>& devices,
                    const utils::RequestContext& ctx) -> std::size_t;

    [[nodiscard]] auto isRefreshInProgress(const std::string& deviceId) const
        -> bool;

    void clear(const std::string& deviceId);
    void clearAll();

private:
    void runRefresh(const Device& device, const utils::RequestContext& ctx);
    auto observe(const Device& device) -> DeviceStatus;
    void releaseRefresh(const std::string& deviceId);

    std::shared_ptr<command::ICommandExecutor> executor_;
    std::weak_ptr<app::EventLoop> loop_;
    ChangeDetector detector_;

    mutable std::mutex statusMutex_;
    std::map<std::string, DeviceStatus> statuses_;

    mutable std::mutex inFlightMutex_;
    std::set<std::string> inFlight_;
};

}  // namespace deq::device

#endif  // DEQ_DEVICE_STATUS_CACHE_HPP
