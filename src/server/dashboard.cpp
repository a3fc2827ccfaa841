/*
 * dashboard.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "dashboard.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "command/shell.hpp"
#include "task/exception.hpp"

namespace deq::server {

namespace {

auto optionalIso(const std::optional<utils::TimePoint>& tp) -> json {
    return tp ? json(utils::toIsoString(*tp)) : json(nullptr);
}

auto optionalText(const std::optional<std::string>& text) -> json {
    return text ? json(*text) : json(nullptr);
}

auto lastStatusJson(const task::Task& task) -> json {
    return task.lastStatus
               ? json(std::string(task::taskStatusToString(*task.lastStatus)))
               : json(nullptr);
}

auto deviceTarget(const std::string& id) -> json {
    return {{"device_id", id}};
}

auto taskTarget(const std::string& id) -> json { return {{"task_id", id}}; }

/// Device summary for health(): percentages are truncated to integers.
auto summarize(const device::Device& device,
               const std::optional<device::DeviceStatus>& status) -> json {
    json info = {{"id", device.id},
                 {"name", device.name.empty() ? "Unknown" : device.name},
                 {"online", nullptr},
                 {"alerts", device.effectiveAlerts()}};
    if (!status) {
        return info;
    }
    info["online"] = json(*status)["online"];

    if (const auto& stats = status->stats) {
        info["cpu"] = static_cast<int>(stats->cpu);
        info["ram"] = static_cast<int>(stats->ramPercent().value_or(0.0));
        info["temp"] = stats->temperature ? json(*stats->temperature)
                                          : json(nullptr);
        if (auto disk = stats->maxDiskPercent()) {
            info["disk"] = static_cast<int>(*disk);
        }
        bool smartFailed = false;
        std::optional<int> diskTemp;
        for (const auto& [name, health] : stats->diskHealth) {
            smartFailed |= health.smart == device::SmartState::Failed;
            if (health.temperature) {
                diskTemp = std::max(diskTemp.value_or(*health.temperature),
                                    *health.temperature);
            }
        }
        if (smartFailed) {
            info["smart_failed"] = true;
        }
        if (diskTemp) {
            info["disk_temp"] = *diskTemp;
        }
    }
    if (!status->containers.empty()) {
        info["containers"] = status->containers;
    }
    return info;
}

}  // namespace

Dashboard::Dashboard(std::shared_ptr<config::IConfigStore> store,
                     std::shared_ptr<device::DeviceStatusCache> cache,
                     std::shared_ptr<task::TaskScheduler> scheduler,
                     std::shared_ptr<command::ICommandExecutor> executor,
                     std::shared_ptr<notify::NotificationManager> notifier,
                     std::shared_ptr<audit::AuditLog> audit)
    : store_(std::move(store)),
      cache_(std::move(cache)),
      scheduler_(std::move(scheduler)),
      executor_(std::move(executor)),
      notifier_(std::move(notifier)),
      audit_(std::move(audit)) {}

auto Dashboard::error(const std::string& message) -> json {
    return {{"success", false}, {"error", message}};
}

auto Dashboard::audited(audit::AuditAction action, const json& target,
                        const utils::RequestContext& ctx, json response,
                        const json& details) -> json {
    if (!audit_) {
        return response;
    }
    const bool ok = response.value("success", false);
    json extra = details;
    if (!ok && response.contains("error")) {
        if (extra.is_null()) {
            extra = json::object();
        }
        extra["error"] = response["error"];
    }
    audit_->record(action,
                   ok ? audit::AuditResult::Success
                      : audit::AuditResult::Failure,
                   target, ctx, extra);
    return response;
}

auto Dashboard::taskStatus(const std::string& id) const -> json {
    auto task = store_->getTask(id);
    if (!task) {
        return error("Task not found");
    }
    return {{"success", true},
            {"running", scheduler_->isTaskRunning(id)},
            {"enabled", task->enabled},
            {"last_run", optionalIso(task->lastRun)},
            {"last_status", lastStatusJson(*task)},
            {"last_error", optionalText(task->lastError)},
            {"last_size", optionalText(task->lastSize)},
            {"next_run", optionalIso(task->nextRun)}};
}

auto Dashboard::toggleTask(const std::string& id,
                           const utils::RequestContext& ctx) -> json {
    const auto target = taskTarget(id);
    auto task = store_->getTask(id);
    if (!task) {
        return audited(audit::AuditAction::ConfigUpdate, target, ctx,
                       error("Task not found"));
    }
    const json details = {{"enabled", !task->enabled}};
    try {
        auto updated = scheduler_->setTaskEnabled(id, !task->enabled);
        if (!updated) {
            return audited(audit::AuditAction::ConfigUpdate, target, ctx,
                           error("Task not found"), details);
        }
        return audited(audit::AuditAction::ConfigUpdate, target, ctx,
                       {{"success", true},
                        {"enabled", updated->enabled},
                        {"next_run", optionalIso(updated->nextRun)}},
                       details);
    } catch (const task::InvalidScheduleException& e) {
        spdlog::warn("{} Cannot toggle task {}: {}", ctx.tag(), id, e.what());
        return audited(audit::AuditAction::ConfigUpdate, target, ctx,
                       error(e.what()), details);
    } catch (const std::exception& e) {
        spdlog::error("{} Cannot toggle task {}: {}", ctx.tag(), id, e.what());
        return audited(audit::AuditAction::ConfigUpdate, target, ctx,
                       error(e.what()), details);
    }
}

auto Dashboard::runTask(const std::string& id,
                        const utils::RequestContext& ctx) -> json {
    auto request = scheduler_->runNow(id, ctx);
    json response = request == task::RunRequest::Started
                        ? json{{"success", true}, {"started", true}}
                        : error(std::string(task::runRequestToString(request)));
    return audited(audit::AuditAction::TaskRun, taskTarget(id), ctx,
                   std::move(response));
}

auto Dashboard::deviceStatus(const std::string& id,
                             const utils::RequestContext& ctx) -> json {
    auto device = store_->getDevice(id);
    if (!device) {
        return audited(audit::AuditAction::DeviceStatus, deviceTarget(id),
                       ctx, error("Device not found"));
    }
    auto cached = cache_->get(id);
    cache_->refreshAsync(*device, ctx);

    json out = cached ? json(*cached)
                      : json{{"online", nullptr},
                             {"stats", nullptr},
                             {"containers", json::object()}};
    out["success"] = true;
    return audited(audit::AuditAction::DeviceStatus, deviceTarget(id), ctx,
                   std::move(out));
}

auto Dashboard::allStatuses() const -> json {
    json statuses = json::object();
    for (const auto& [id, status] : cache_->getAll()) {
        statuses[id] = status;
    }
    return {{"success", true}, {"statuses", std::move(statuses)}};
}

auto Dashboard::wakeDevice(const std::string& id,
                           const utils::RequestContext& ctx) -> json {
    auto respond = [&](json response) {
        return audited(audit::AuditAction::DeviceWake, deviceTarget(id), ctx,
                       std::move(response));
    };
    auto device = store_->getDevice(id);
    if (!device) {
        return respond(error("Device not found"));
    }
    if (!device->wol || device->wol->mac.empty()) {
        return respond(error("WOL not configured"));
    }

    auto result = executor_->wakeOnLan(device->wol->mac, device->wol->broadcast);
    if (!result.success) {
        spdlog::warn("{} Wake of {} failed: {}", ctx.tag(), id, result.error);
        return respond(error(result.error));
    }
    spdlog::info("{} Sent Wake-on-LAN to {}", ctx.tag(), id);
    return respond({{"success", true}});
}

auto Dashboard::shutdownDevice(const std::string& id,
                               const utils::RequestContext& ctx) -> json {
    auto respond = [&](json response) {
        return audited(audit::AuditAction::DeviceShutdown, deviceTarget(id),
                       ctx, std::move(response));
    };
    auto device = store_->getDevice(id);
    if (!device) {
        return respond(error("Device not found"));
    }
    if (!device->isHost && !device->hasSshCredentials()) {
        return respond(error("SSH not configured"));
    }

    auto result = executor_->shutdown(*device);
    if (!result.success) {
        spdlog::warn("{} Shutdown of {} failed: {}", ctx.tag(), id,
                     result.error);
        return respond(error(result.error));
    }
    spdlog::info("{} Shutdown of {} issued", ctx.tag(), id);
    return respond({{"success", true}});
}

auto Dashboard::dockerAction(const std::string& id,
                             const std::string& container,
                             const std::string& action,
                             const utils::RequestContext& ctx) -> json {
    auto device = store_->getDevice(id);
    if (!device) {
        return error("Device not found");
    }
    if (!command::isValidContainerName(container)) {
        return error("Invalid container name");
    }
    if (std::ranges::find(device->containers, container) ==
        device->containers.end()) {
        return error("Container '" + container + "' not configured");
    }
    if (!device->isHost && !device->hasSshCredentials()) {
        return error("SSH not configured");
    }

    if (action == "status") {
        auto states = executor_->fetchContainerStates(*device);
        auto it = states.find(container);
        if (it == states.end() || it->second == device::kContainerUnknown) {
            return error("Container not found");
        }
        return {{"success", true},
                {"status", it->second},
                {"running", it->second == device::kContainerRunning}};
    }

    command::ContainerAction containerAction;
    audit::AuditAction auditAction;
    if (action == "start") {
        containerAction = command::ContainerAction::Start;
        auditAction = audit::AuditAction::DockerStart;
    } else if (action == "stop") {
        containerAction = command::ContainerAction::Stop;
        auditAction = audit::AuditAction::DockerStop;
    } else {
        return error("Unknown action: " + action);
    }

    const json target = {{"device_id", id}, {"container", container}};
    auto result = executor_->runAction(*device, container, containerAction);
    if (!result.success) {
        spdlog::warn("{} docker {} {} on {} failed: {}", ctx.tag(), action,
                     container, id, result.error);
        return audited(auditAction, target, ctx, error(result.error));
    }
    spdlog::info("{} docker {} {} on {}", ctx.tag(), action, container, id);
    return audited(auditAction, target, ctx, {{"success", true}});
}

auto Dashboard::testNotification(const std::string& channel,
                                 const utils::RequestContext& ctx) -> json {
    json results = json::object();
    bool anySuccess = false;
    for (const auto& outcome : notifier_->sendTest(channel)) {
        json entry = {{"success", outcome.success}};
        if (!outcome.success) {
            entry["error"] = outcome.error;
        }
        anySuccess |= outcome.success;
        results[outcome.channel] = std::move(entry);
    }
    json response = {{"success", anySuccess},
                     {"results", results},
                     {"message", anySuccess ? "Test notifications sent"
                                            : "No notifications sent"}};
    return audited(audit::AuditAction::NotificationTest,
                   {{"channel", channel}}, ctx, std::move(response),
                   {{"results", std::move(results)}});
}

auto Dashboard::health(const utils::RequestContext& ctx) -> json {
    json devices = json::array();
    int running = 0;
    int stopped = 0;
    for (const auto& device : store_->listDevices()) {
        auto status = cache_->get(device.id);
        cache_->refreshAsync(device, ctx);
        if (status) {
            for (const auto& [name, state] : status->containers) {
                if (state == device::kContainerRunning) {
                    ++running;
                } else {
                    ++stopped;
                }
            }
        }
        devices.push_back(summarize(device, status));
    }

    json tasks = json::array();
    for (const auto& task : store_->listTasks()) {
        if (!task.lastStatus) {
            continue;
        }
        tasks.push_back({{"id", task.id},
                         {"name", task.name.empty() ? "Unknown" : task.name},
                         {"status", lastStatusJson(task)},
                         {"error", optionalText(task.lastError)},
                         {"last_run", optionalIso(task.lastRun)}});
    }

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                         utils::Clock::now().time_since_epoch())
                         .count();
    return {{"devices", std::move(devices)},
            {"containers", {{"running", running}, {"stopped", stopped}}},
            {"tasks", std::move(tasks)},
            {"timestamp", now}};
}

}  // namespace deq::server
