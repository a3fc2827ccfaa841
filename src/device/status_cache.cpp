/*
 * status_cache.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "status_cache.hpp"

#include <functional>

#include <spdlog/spdlog.h>

#include "utils/scope_guard.hpp"

namespace deq::device {

DeviceStatusCache::DeviceStatusCache(
    std::shared_ptr<command::ICommandExecutor> executor,
    std::shared_ptr<notify::INotificationDispatcher> dispatcher,
    std::shared_ptr<app::EventLoop> loop)
    : executor_(std::move(executor)),
      loop_(std::move(loop)),
      detector_(std::move(dispatcher)) {}

auto DeviceStatusCache::get(const std::string& deviceId) const
    -> std::optional<DeviceStatus> {
    std::lock_guard<std::mutex> lock(statusMutex_);
    auto it = statuses_.find(deviceId);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto DeviceStatusCache::getAll() const -> std::map<std::string, DeviceStatus> {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return statuses_;
}

auto DeviceStatusCache::refreshAsync(const Device& device,
                                     const utils::RequestContext& ctx)
    -> RefreshRequest {
    {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        if (!inFlight_.insert(device.id).second) {
            spdlog::debug("{} Refresh of {} already in progress", ctx.tag(),
                          device.id);
            return RefreshRequest::AlreadyInProgress;
        }
    }

    // Clears the marker once the refresh has run, was discarded by a
    // stopping loop or could not be queued at all.
    auto release = std::make_shared<utils::ScopeGuard<std::function<void()>>>(
        [weak = weak_from_this(), id = device.id] {
            if (auto self = weak.lock()) {
                self->releaseRefresh(id);
            }
        });

    auto loop = loop_.lock();
    if (!loop) {
        spdlog::warn("{} Refresh of {} not queued: worker pool is gone",
                     ctx.tag(), device.id);
        return RefreshRequest::Rejected;
    }
    try {
        loop->post([self = shared_from_this(), device, ctx, release] {
            self->runRefresh(device, ctx);
        });
    } catch (const std::exception& e) {
        spdlog::warn("{} Refresh of {} not queued: {}", ctx.tag(), device.id,
                     e.what());
        return RefreshRequest::Rejected;
    }
    spdlog::debug("{} Refresh of {} queued", ctx.tag(), device.id);
    return RefreshRequest::Started;
}

auto DeviceStatusCache::refreshAll(const std::vector<Device>& devices,
                                   const utils::RequestContext& ctx)
    -> std::size_t {
    std::size_t started = 0;
    for (const auto& device : devices) {
        if (refreshAsync(device, ctx) == RefreshRequest::Started) {
            ++started;
        }
    }
    return started;
}

auto DeviceStatusCache::isRefreshInProgress(const std::string& deviceId) const
    -> bool {
    std::lock_guard<std::mutex> lock(inFlightMutex_);
    return inFlight_.contains(deviceId);
}

void DeviceStatusCache::releaseRefresh(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(inFlightMutex_);
    inFlight_.erase(deviceId);
}

void DeviceStatusCache::clear(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    statuses_.erase(deviceId);
}

void DeviceStatusCache::clearAll() {
    std::lock_guard<std::mutex> lock(statusMutex_);
    statuses_.clear();
}

auto DeviceStatusCache::observe(const Device& device) -> DeviceStatus {
    DeviceStatus status;
    status.containers = executor_->fetchContainerStates(device);

    const bool online = device.isHost || executor_->probe(device);
    status.online = online ? OnlineState::Online : OnlineState::Offline;

    if (online && (device.isHost || device.hasSshCredentials())) {
        status.stats = executor_->fetchStats(device);
    }
    status.updatedAt = std::chrono::system_clock::now();
    return status;
}

void DeviceStatusCache::runRefresh(const Device& device,
                                   const utils::RequestContext& ctx) {
    try {
        auto status = observe(device);
        detector_.evaluate(device, status);
        {
            std::lock_guard<std::mutex> lock(statusMutex_);
            statuses_[device.id] = status;
        }
        spdlog::debug("{} Refreshed {}: {}", ctx.tag(), device.id,
                      status.isOnline() ? "online" : "offline");
    } catch (const std::exception& e) {
        spdlog::error("{} Refresh of {} failed: {}", ctx.tag(), device.id,
                      e.what());
    }
}

}  // namespace deq::device
