/*
 * scheduler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-18

Description: Background thread that starts due tasks and keeps their
next_run up to date

**************************************************/

#ifndef DEQ_TASK_SCHEDULER_HPP
#define DEQ_TASK_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "config/config_store.hpp"
#include "task_runner.hpp"
#include "task_types.hpp"

namespace deq::task {

class TaskScheduler {
public:
    TaskScheduler(std::shared_ptr<config::IConfigStore> store,
                  std::shared_ptr<TaskRunner> runner,
                  std::chrono::seconds pollInterval = std::chrono::seconds(60));
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    /**
     * @brief Starts the polling thread. A second call is a no-op.
     */
    void start();

    /**
     * @brief Stops triggering new runs and joins the polling thread.
     *
     * Runs already started keep going on the runner's pool.
     */
    void stop();

    [[nodiscard]] auto isRunning() const -> bool {
        return running_.load(std::memory_order_acquire);
    }

    /**
     * @brief One scheduling pass at @p now.
     *
     * Starts every enabled task whose next_run is due, then advances its
     * next_run. Enabled tasks without a next_run get one. Tasks with a
     * malformed schedule are skipped with a warning.
     *
     * @return Number of runs requested
     */
    auto pollOnce(utils::TimePoint now) -> std::size_t;

    /**
     * @copydoc deq::task::computeNextRun
     */
    static auto computeNextRun(const Task& task, utils::TimePoint now)
        -> std::optional<utils::TimePoint>;

    [[nodiscard]] auto isTaskRunning(const std::string& id) const -> bool;

    auto runNow(const std::string& id, const utils::RequestContext& ctx)
        -> RunRequest;

    /**
     * @brief Enables or disables a task and refreshes its next_run.
     * @return The updated task, or std::nullopt when it does not exist
     * @throws InvalidScheduleException when enabling a malformed schedule
     */
    auto setTaskEnabled(const std::string& id, bool enabled)
        -> std::optional<Task>;

    /**
     * @brief Upserts @p task with a freshly computed next_run.
     * @throws InvalidScheduleException
     */
    auto saveTask(Task task) -> Task;

private:
    void loop(std::stop_token stopToken);

    std::shared_ptr<config::IConfigStore> store_;
    std::shared_ptr<TaskRunner> runner_;
    std::chrono::seconds pollInterval_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    std::jthread thread_;
};

}  // namespace deq::task

#endif  // DEQ_TASK_SCHEDULER_HPP
