/*
 * dashboard.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-19

Description: JSON facade over the status cache, the task scheduler and the
device actions, as served to the dashboard front end

**************************************************/

#ifndef DEQ_SERVER_DASHBOARD_HPP
#define DEQ_SERVER_DASHBOARD_HPP

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "audit/audit_log.hpp"
#include "command/command_executor.hpp"
#include "config/config_store.hpp"
#include "device/status_cache.hpp"
#include "notify/notification_manager.hpp"
#include "task/scheduler.hpp"
#include "utils/request_context.hpp"

namespace deq::server {

using json = nlohmann::json;

/**
 * @brief Request handlers of the dashboard API.
 *
 * Every handler returns a JSON object with a "success" flag and an "error"
 * text on failure. Status handlers answer from the cache and queue a
 * refresh; device actions (wake, shutdown, docker) run synchronously on the
 * calling thread. State-changing calls are written to the audit log when
 * one is configured.
 */
class Dashboard {
public:
    /**
     * @param audit May be null
     */
    Dashboard(std::shared_ptr<config::IConfigStore> store,
              std::shared_ptr<device::DeviceStatusCache> cache,
              std::shared_ptr<task::TaskScheduler> scheduler,
              std::shared_ptr<command::ICommandExecutor> executor,
              std::shared_ptr<notify::NotificationManager> notifier,
              std::shared_ptr<audit::AuditLog> audit = nullptr);

    auto taskStatus(const std::string& id) const -> json;
    auto toggleTask(const std::string& id, const utils::RequestContext& ctx)
        -> json;
    auto runTask(const std::string& id, const utils::RequestContext& ctx)
        -> json;

    /**
     * @brief Cached status of one device; also queues a refresh.
     */
    auto deviceStatus(const std::string& id, const utils::RequestContext& ctx)
        -> json;

    auto allStatuses() const -> json;

    /**
     * @brief Sends a Wake-on-LAN packet to the device's configured MAC.
     */
    auto wakeDevice(const std::string& id, const utils::RequestContext& ctx)
        -> json;

    /**
     * @brief Powers the device off: locally for the host, over SSH
     * otherwise.
     */
    auto shutdownDevice(const std::string& id,
                        const utils::RequestContext& ctx) -> json;

    /**
     * @brief "start", "stop" or "status" of a container the device declares.
     */
    auto dockerAction(const std::string& id, const std::string& container,
                      const std::string& action,
                      const utils::RequestContext& ctx) -> json;

    /**
     * @brief Sends a test message to @p channel ("all" for every channel).
     * Succeeds when at least one channel delivered it.
     */
    auto testNotification(const std::string& channel,
                          const utils::RequestContext& ctx) -> json;

    /**
     * @brief Overview of every device, container and task outcome. Queues
     * a refresh of every device.
     */
    auto health(const utils::RequestContext& ctx) -> json;

private:
    static auto error(const std::string& message) -> json;

    /**
     * @brief Audits @p response (by its "success" flag) and returns it.
     */
    auto audited(audit::AuditAction action, const json& target,
                 const utils::RequestContext& ctx, json response,
                 const json& details = nullptr) -> json;

    std::shared_ptr<config::IConfigStore> store_;
    std::shared_ptr<device::DeviceStatusCache> cache_;
    std::shared_ptr<task::TaskScheduler> scheduler_;
    std::shared_ptr<command::ICommandExecutor> executor_;
    std::shared_ptr<notify::NotificationManager> notifier_;
    std::shared_ptr<audit::AuditLog> audit_;
};

}  // namespace deq::server

#endif  // DEQ_SERVER_DASHBOARD_HPP
