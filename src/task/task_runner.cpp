/*
 * task_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "task_runner.hpp"

#include <algorithm>
#include <atomic>

#include <spdlog/spdlog.h>

#include "exception.hpp"
#include "schedule.hpp"

namespace deq::task {

namespace {

constexpr std::chrono::seconds kBackupTimeout{3600};

}  // namespace

auto runRequestToString(RunRequest request) -> std::string_view {
    switch (request) {
        case RunRequest::Started:
            return "started";
        case RunRequest::AlreadyRunning:
            return "Task already running";
        case RunRequest::NotFound:
            return "Task not found";
        case RunRequest::Rejected:
            return "Task runner is shutting down";
    }
    return "unknown";
}

/**
 * @brief Shared by run() and the queued closure. Releases the running marker
 * when the last of them lets go, and records a skipped run if the pool
 * discarded the closure before it started.
 */
class TaskRunner::QueuedRun {
public:
    QueuedRun(std::weak_ptr<TaskRunner> runner, std::string id,
              utils::RequestContext ctx)
        : runner_(std::move(runner)), id_(std::move(id)), ctx_(std::move(ctx)) {}

    ~QueuedRun() {
        auto runner = runner_.lock();
        if (!runner) {
            return;
        }
        if (accepted_ && !started_) {
            spdlog::warn("{} Task {} discarded before it started", ctx_.tag(),
                         id_);
            std::string reason(runRequestToString(RunRequest::Rejected));
            runner->recordResult(id_, TaskResult::skipped(std::move(reason)),
                                 ctx_);
        }
        runner->releaseRun(id_);
    }

    QueuedRun(const QueuedRun&) = delete;
    QueuedRun& operator=(const QueuedRun&) = delete;

    void markAccepted() { accepted_ = true; }
    void markStarted() { started_ = true; }

private:
    std::weak_ptr<TaskRunner> runner_;
    std::string id_;
    utils::RequestContext ctx_;
    std::atomic<bool> accepted_{false};
    std::atomic<bool> started_{false};
};

TaskRunner::TaskRunner(
    std::shared_ptr<config::IConfigStore> store,
    std::shared_ptr<command::ICommandExecutor> executor,
    std::shared_ptr<notify::INotificationDispatcher> dispatcher,
    std::shared_ptr<app::EventLoop> loop, std::filesystem::path taskLogDir,
    std::shared_ptr<audit::AuditLog> audit)
    : store_(std::move(store)),
      executor_(std::move(executor)),
      dispatcher_(std::move(dispatcher)),
      loop_(std::move(loop)),
      taskLogDir_(std::move(taskLogDir)),
      audit_(std::move(audit)) {
    if (!dispatcher_) {
        dispatcher_ = std::make_shared<notify::NullNotificationDispatcher>();
    }
}

auto TaskRunner::run(const std::string& id, const utils::RequestContext& ctx)
    -> RunRequest {
    if (!store_->getTask(id)) {
        spdlog::warn("{} Run of unknown task {}", ctx.tag(), id);
        return RunRequest::NotFound;
    }
    auto loop = loop_.lock();
    if (!loop) {
        spdlog::warn("{} Task {} not queued: worker pool is gone", ctx.tag(),
                     id);
        return RunRequest::Rejected;
    }
    {
        std::lock_guard<std::mutex> lock(runningMutex_);
        if (!running_.insert(id).second) {
            spdlog::info("{} Task {} already running", ctx.tag(), id);
            return RunRequest::AlreadyRunning;
        }
    }

    auto queued = std::make_shared<QueuedRun>(weak_from_this(), id, ctx);
    try {
        loop->post([self = shared_from_this(), id, ctx, queued] {
            queued->markStarted();
            self->runTask(id, ctx);
        });
    } catch (const std::exception& e) {
        spdlog::warn("{} Task {} not queued: {}", ctx.tag(), id, e.what());
        return RunRequest::Rejected;
    }
    queued->markAccepted();
    spdlog::info("{} Task {} started", ctx.tag(), id);
    return RunRequest::Started;
}

auto TaskRunner::isRunning(const std::string& id) const -> bool {
    std::lock_guard<std::mutex> lock(runningMutex_);
    return running_.contains(id);
}

auto TaskRunner::runningTasks() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(runningMutex_);
    return {running_.begin(), running_.end()};
}

void TaskRunner::runTask(const std::string& id,
                         const utils::RequestContext& ctx) {
    auto task = store_->getTask(id);
    if (!task) {
        spdlog::warn("{} Task {} disappeared before it ran", ctx.tag(), id);
        return;
    }

    TaskLog log(taskLogDir_, id);
    log.write("Starting {} task: {}", taskTypeToString(task->type),
              task->name.empty() ? "unnamed" : task->name);

    TaskResult result;
    try {
        result = executeTask(*task, log);
    } catch (const std::exception& e) {
        result = TaskResult::failed(e.what());
        log.write("Exception: {}", e.what());
    }

    switch (result.status) {
        case TaskStatus::Success:
            log.write("Completed successfully");
            spdlog::info("{} Task {} succeeded{}", ctx.tag(), id,
                         result.size.empty() ? "" : " (" + result.size + ")");
            break;
        case TaskStatus::Skipped:
            log.write("Skipped: {}", result.error);
            spdlog::info("{} Task {} skipped: {}", ctx.tag(), id,
                         result.error);
            break;
        case TaskStatus::Failed:
            if (result.error.empty()) {
                result.error = "unknown error";
            }
            log.write("Failed: {}", result.error);
            spdlog::warn("{} Task {} failed: {}", ctx.tag(), id, result.error);
            break;
    }

    recordResult(id, result, ctx);
    if (result.status == TaskStatus::Failed) {
        notifyFailure(*task, result.error);
    }
}

void TaskRunner::recordResult(const std::string& id, const TaskResult& result,
                              const utils::RequestContext& ctx) {
    const auto now = utils::Clock::now();
    if (audit_) {
        const json target = {{"task_id", id}};
        switch (result.status) {
            case TaskStatus::Success:
                audit_->record(audit::AuditAction::TaskComplete,
                               audit::AuditResult::Success, target, ctx,
                               result.size.empty()
                                   ? json(nullptr)
                                   : json{{"size", result.size}});
                break;
            case TaskStatus::Skipped:
                audit_->record(audit::AuditAction::TaskComplete,
                               audit::AuditResult::Success, target, ctx,
                               {{"status", "skipped"},
                                {"reason", result.error}});
                break;
            case TaskStatus::Failed:
                audit_->record(audit::AuditAction::TaskFailed,
                               audit::AuditResult::Failure, target, ctx,
                               {{"error", result.error}});
                break;
        }
    }

    try {
        auto updated = store_->modifyTask(id, [&](Task& task) {
            task.lastRun = now;
            task.lastStatus = result.status;
            if (result.status == TaskStatus::Success) {
                task.lastError.reset();
                if (!result.size.empty()) {
                    task.lastSize = result.size;
                }
            } else {
                task.lastError = result.error;
            }
            // Uses the stored task, so a disable during the run sticks.
            try {
                task.nextRun = computeNextRun(task, now);
            } catch (const InvalidScheduleException& e) {
                spdlog::warn("Task {} has an invalid schedule: {}", id,
                             e.what());
                task.nextRun.reset();
            }
        });
        if (!updated) {
            spdlog::warn("Task {} was removed while running", id);
        }
    } catch (const std::exception& e) {
        spdlog::error("Cannot record result of task {}: {}", id, e.what());
    }
}

void TaskRunner::releaseRun(const std::string& id) {
    std::lock_guard<std::mutex> lock(runningMutex_);
    running_.erase(id);
}

void TaskRunner::notifyFailure(const Task& task, const std::string& error) {
    try {
        dispatcher_->dispatch(
            notify::TaskFailed{task.id, task.displayName(), error});
    } catch (const std::exception& e) {
        spdlog::error("Failure notification for task {} failed: {}", task.id,
                      e.what());
    }
}

auto TaskRunner::executeTask(const Task& task, TaskLog& log) -> TaskResult {
    switch (task.type) {
        case TaskType::Backup:
            return runBackup(task, log);
        case TaskType::Wake:
            return runWake(task, log);
        case TaskType::Shutdown:
            return runShutdown(task, log);
        case TaskType::Unknown:
            break;
    }
    std::string typeName(taskTypeToString(task.type));
    if (auto it = task.raw.find("type");
        it != task.raw.end() && it->is_string()) {
        typeName = it->get<std::string>();
    }
    return TaskResult::failed("Unknown task type: " + typeName);
}

auto TaskRunner::runBackup(const Task& task, TaskLog& log) -> TaskResult {
    auto source = store_->getDevice(task.source.device);
    auto dest = store_->getDevice(task.dest.device);
    if (!source || !dest) {
        return TaskResult::failed("Source or destination device not found");
    }
    if (task.source.path.empty() || task.dest.path.empty()) {
        return TaskResult::failed("Source or destination path not specified");
    }
    if (!source->isHost && !executor_->probe(*source)) {
        return TaskResult::skipped("source offline");
    }

    log.write("Syncing {}:{} -> {}:{}{}", source->displayName(),
              task.source.path, dest->displayName(), task.dest.path,
              task.deleteExtraneous ? " (delete)" : "");

    command::SyncOptions options;
    options.deleteExtraneous = task.deleteExtraneous;
    options.timeout = kBackupTimeout;
    auto result = executor_->sync(*source, task.source.path, *dest,
                                  task.dest.path, options);
    if (result.timedOut) {
        return TaskResult::failed("timeout (1h)");
    }
    if (!result.success) {
        return TaskResult::failed(result.error.empty() ? "rsync failed"
                                                       : result.error);
    }
    return TaskResult::success(result.sizeSummary);
}

auto TaskRunner::runContainerAction(const Task& task,
                                    command::ContainerAction action,
                                    TaskLog& log) -> TaskResult {
    if (task.container.empty()) {
        return TaskResult::failed("No container specified");
    }
    // Containers without an explicit device live on the host.
    std::optional<device::Device> device;
    if (!task.device.empty()) {
        device = store_->getDevice(task.device);
    } else {
        auto devices = store_->listDevices();
        auto it = std::ranges::find_if(
            devices, [](const device::Device& d) { return d.isHost; });
        if (it != devices.end()) {
            device = *it;
        }
    }
    if (!device) {
        return TaskResult::failed("Device not found");
    }

    log.write("docker {} {} on {}", command::containerActionName(action),
              task.container, device->displayName());
    auto result = executor_->runAction(*device, task.container, action);
    return result.success ? TaskResult::success()
                          : TaskResult::failed(result.error);
}

auto TaskRunner::runWake(const Task& task, TaskLog& log) -> TaskResult {
    if (task.target == TargetKind::Docker) {
        return runContainerAction(task, command::ContainerAction::Start, log);
    }

    const auto& deviceId =
        task.device.empty() ? task.source.device : task.device;
    auto device = store_->getDevice(deviceId);
    if (!device) {
        return TaskResult::failed("Device not found");
    }
    if (!device->wol || device->wol->mac.empty()) {
        return TaskResult::failed("Device has no WOL configured");
    }

    log.write("Sending Wake-on-LAN to {} via {}", device->wol->mac,
              device->wol->broadcast);
    auto result =
        executor_->wakeOnLan(device->wol->mac, device->wol->broadcast);
    return result.success ? TaskResult::success()
                          : TaskResult::failed(result.error);
}

auto TaskRunner::runShutdown(const Task& task, TaskLog& log) -> TaskResult {
    if (task.target == TargetKind::Docker) {
        return runContainerAction(task, command::ContainerAction::Stop, log);
    }

    auto device = store_->getDevice(task.device);
    if (!device) {
        return TaskResult::failed("Device not found");
    }
    if (!device->isHost && !device->hasSshCredentials()) {
        return TaskResult::failed("Device has no SSH configured");
    }

    log.write("Shutting down {}", device->displayName());
    auto result = executor_->shutdown(*device);
    return result.success ? TaskResult::success()
                          : TaskResult::failed(result.error);
}

}  // namespace deq::task
