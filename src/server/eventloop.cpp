#include "eventloop.hpp"

#include <algorithm>

namespace deq::app {

auto EventLoop::Task::operator<(const Task& other) const -> bool {
    if (priority != other.priority) {
        return priority < other.priority;
    }
    if (execution_time != other.execution_time) {
        return execution_time > other.execution_time;
    }
    return sequence > other.sequence;
}

EventLoop::EventLoop(int thread_count, std::string name)
    : name_(std::move(name)) {
    thread_count = std::max(1, thread_count);
    spdlog::info("Initializing EventLoop '{}' with {} threads", name_,
                 thread_count);
    for (int i = 0; i < thread_count; ++i) {
        thread_pool_.emplace_back(&EventLoop::workerThread, this);
    }
}

EventLoop::~EventLoop() {
    stop();
    for (auto& thread : thread_pool_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    spdlog::debug("EventLoop '{}' shutdown completed", name_);
}

void EventLoop::stop() {
    if (stop_flag_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    spdlog::info("Stopping EventLoop '{}'", name_);

    // Queued closures are destroyed outside the lock so that their captured
    // state can release markers or record results without re-entering it.
    std::priority_queue<Task> discarded;
    {
        std::lock_guard lock(queue_mutex_);
        discarded.swap(tasks_);
    }
    condition_.notify_all();
    if (!discarded.empty()) {
        spdlog::info("EventLoop '{}' discarded {} queued tasks", name_,
                     discarded.size());
    }
}

auto EventLoop::pendingCount() const -> std::size_t {
    std::lock_guard lock(queue_mutex_);
    return tasks_.size();
}

void EventLoop::enqueue(std::function<void()> function, int priority,
                        std::chrono::steady_clock::time_point execution_time) {
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_flag_.load(std::memory_order_acquire)) {
            spdlog::warn("EventLoop '{}' is stopped, task rejected", name_);
            throw std::runtime_error("EventLoop '" + name_ + "' is stopped");
        }
        tasks_.push(Task{std::move(function), priority, execution_time,
                         next_sequence_++});
    }
    condition_.notify_one();
}

void EventLoop::workerThread() {
    spdlog::debug("Worker thread started [EventLoop '{}']", name_);

    while (true) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            while (true) {
                if (stop_flag_.load(std::memory_order_acquire)) {
                    spdlog::debug("Worker thread terminated [EventLoop '{}']",
                                  name_);
                    return;
                }
                if (tasks_.empty()) {
                    condition_.wait(lock);
                    continue;
                }
                auto now = std::chrono::steady_clock::now();
                auto due = tasks_.top().execution_time;
                if (due > now) {
                    condition_.wait_until(lock, due);
                    continue;
                }
                task = std::move(const_cast<Task&>(tasks_.top()));
                tasks_.pop();
                break;
            }
        }

        try {
            task.function();
        } catch (const std::exception& e) {
            spdlog::error("Task execution failed [EventLoop '{}']: {}", name_,
                          e.what());
        }
    }
}

}  // namespace deq::app
