/*
 * task_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-18

Description: Executes backup, wake and shutdown tasks on a worker pool,
at most one run per task at a time

**************************************************/

#ifndef DEQ_TASK_TASK_RUNNER_HPP
#define DEQ_TASK_TASK_RUNNER_HPP

#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "audit/audit_log.hpp"
#include "command/command_executor.hpp"
#include "config/config_store.hpp"
#include "notify/dispatcher.hpp"
#include "server/eventloop.hpp"
#include "task_log.hpp"
#include "task_types.hpp"
#include "utils/request_context.hpp"

namespace deq::task {

enum class RunRequest {
    Started,
    AlreadyRunning,
    NotFound,
    Rejected  ///< The worker pool is shutting down
};

auto runRequestToString(RunRequest request) -> std::string_view;

/**
 * @brief Outcome of one task body.
 */
struct TaskResult {
    TaskStatus status{TaskStatus::Failed};
    std::string error;
    std::string size;  ///< backup only

    static auto success(std::string size = {}) -> TaskResult {
        return TaskResult{TaskStatus::Success, {}, std::move(size)};
    }
    static auto failed(std::string error) -> TaskResult {
        return TaskResult{TaskStatus::Failed, std::move(error), {}};
    }
    static auto skipped(std::string reason) -> TaskResult {
        return TaskResult{TaskStatus::Skipped, std::move(reason), {}};
    }
};

/**
 * @brief Runs tasks in the background and records their outcome.
 *
 * Must be owned by a std::shared_ptr, since queued runs keep the runner
 * alive. The worker pool is held weakly. A run that was accepted but
 * discarded by a stopping pool is recorded as skipped.
 */
class TaskRunner : public std::enable_shared_from_this<TaskRunner> {
public:
    /**
     * @param dispatcher May be null, in which case failures are not notified
     * @param loop Worker pool, held weakly
     * @param taskLogDir Directory of the per-task run logs
     * @param audit May be null; otherwise every recorded outcome is audited
     */
    TaskRunner(std::shared_ptr<config::IConfigStore> store,
               std::shared_ptr<command::ICommandExecutor> executor,
               std::shared_ptr<notify::INotificationDispatcher> dispatcher,
               std::shared_ptr<app::EventLoop> loop,
               std::filesystem::path taskLogDir,
               std::shared_ptr<audit::AuditLog> audit = nullptr);

    /**
     * @brief Queues a run of task @p id and returns immediately.
     */
    auto run(const std::string& id, const utils::RequestContext& ctx)
        -> RunRequest;

    [[nodiscard]] auto isRunning(const std::string& id) const -> bool;
    [[nodiscard]] auto runningTasks() const -> std::vector<std::string>;

    /**
     * @brief Task body only, synchronously. Does not persist anything.
     */
    auto executeTask(const Task& task, TaskLog& log) -> TaskResult;

private:
    class QueuedRun;

    void runTask(const std::string& id, const utils::RequestContext& ctx);
    void recordResult(const std::string& id, const TaskResult& result,
                      const utils::RequestContext& ctx);
    void notifyFailure(const Task& task, const std::string& error);
    void releaseRun(const std::string& id);

    auto runBackup(const Task& task, TaskLog& log) -> TaskResult;
    auto runWake(const Task& task, TaskLog& log) -> TaskResult;
    auto runShutdown(const Task& task, TaskLog& log) -> TaskResult;
    auto runContainerAction(const Task& task, command::ContainerAction action,
                            TaskLog& log) -> TaskResult;

    std::shared_ptr<config::IConfigStore> store_;
    std::shared_ptr<command::ICommandExecutor> executor_;
    std::shared_ptr<notify::INotificationDispatcher> dispatcher_;
    std::weak_ptr<app::EventLoop> loop_;
    std::filesystem::path taskLogDir_;
    std::shared_ptr<audit::AuditLog> audit_;

    mutable std::mutex runningMutex_;
    std::set<std::string> running_;
};

}  // namespace deq::task

#endif  // DEQ_TASK_TASK_RUNNER_HPP
