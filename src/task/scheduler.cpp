/*
 * scheduler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "scheduler.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "exception.hpp"
#include "schedule.hpp"

namespace deq::task {

namespace {
constexpr auto kSleepSlice = std::chrono::seconds(1);
}

TaskScheduler::TaskScheduler(std::shared_ptr<config::IConfigStore> store,
                             std::shared_ptr<TaskRunner> runner,
                             std::chrono::seconds pollInterval)
    : store_(std::move(store)),
      runner_(std::move(runner)),
      pollInterval_(std::max(pollInterval, std::chrono::seconds(1))) {}

TaskScheduler::~TaskScheduler() { stop(); }

void TaskScheduler::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    running_.store(true, std::memory_order_release);
    thread_ = std::jthread([this](std::stop_token st) { loop(st); });
    spdlog::info("Task scheduler started (poll every {}s)",
                 pollInterval_.count());
}

void TaskScheduler::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    thread_.request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::info("Task scheduler stopped");
}

void TaskScheduler::loop(std::stop_token stopToken) {
    while (!stopToken.stop_requested()) {
        try {
            pollOnce(utils::Clock::now());
        } catch (const std::exception& e) {
            spdlog::error("Error checking tasks: {}", e.what());
        }

        // Sleep in short slices so stop() returns quickly.
        auto waited = std::chrono::seconds(0);
        while (waited < pollInterval_ && !stopToken.stop_requested()) {
            std::this_thread::sleep_for(kSleepSlice);
            waited += kSleepSlice;
        }
    }
}

auto TaskScheduler::pollOnce(utils::TimePoint now) -> std::size_t {
    std::size_t triggered = 0;
    for (const auto& task : store_->listTasks()) {
        if (!task.enabled) {
            continue;
        }
        try {
            if (!task.nextRun) {
                auto next = computeNextRun(task, now);
                // Schedules without a next occurrence would otherwise
                // rewrite the config file on every poll.
                if (next != task.nextRun) {
                    store_->modifyTask(task.id,
                                       [&next](Task& t) { t.nextRun = next; });
                }
                continue;
            }
            if (*task.nextRun > now) {
                continue;
            }

            spdlog::info("Running scheduled task: {} ({})",
                         task.displayName(), task.id);
            auto request = runner_->run(task.id, utils::RequestContext{});
            if (request == RunRequest::Started) {
                ++triggered;
            } else {
                spdlog::warn("Scheduled task {} not started: {}", task.id,
                             runRequestToString(request));
            }

            store_->modifyTask(task.id, [now](Task& t) {
                t.nextRun = TaskScheduler::computeNextRun(t, now);
            });
        } catch (const InvalidScheduleException& e) {
            spdlog::warn("Skipping task {} with invalid schedule: {}", task.id,
                         e.what());
        } catch (const std::exception& e) {
            spdlog::error("Cannot schedule task {}: {}", task.id, e.what());
        }
    }
    return triggered;
}

auto TaskScheduler::computeNextRun(const Task& task, utils::TimePoint now)
    -> std::optional<utils::TimePoint> {
    return task::computeNextRun(task, now);
}

auto TaskScheduler::isTaskRunning(const std::string& id) const -> bool {
    return runner_->isRunning(id);
}

auto TaskScheduler::runNow(const std::string& id,
                           const utils::RequestContext& ctx) -> RunRequest {
    return runner_->run(id, ctx);
}

auto TaskScheduler::setTaskEnabled(const std::string& id, bool enabled)
    -> std::optional<Task> {
    const auto now = utils::Clock::now();
    return store_->modifyTask(id, [enabled, now](Task& t) {
        t.enabled = enabled;
        t.nextRun = TaskScheduler::computeNextRun(t, now);
    });
}

auto TaskScheduler::saveTask(Task task) -> Task {
    task.nextRun = computeNextRun(task, utils::Clock::now());
    store_->saveTask(task);
    return task;
}

}  // namespace deq::task
