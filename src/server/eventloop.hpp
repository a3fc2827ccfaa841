/*
 * eventloop.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef DEQ_SERVER_EVENTLOOP_HPP
#define DEQ_SERVER_EVENTLOOP_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include <spdlog/spdlog.h>

namespace deq::app {

/**
 * @brief Worker pool that runs detached work for the status cache and the
 * task runner.
 *
 * Tasks are ordered by priority and then by execution time. Work posted
 * through post() never blocks the caller; the returned future may be
 * dropped.
 *
 * The loop must be destroyed on a thread that is not one of its workers.
 * Clients therefore hold it through a weak_ptr and never from inside a
 * posted closure.
 */
class EventLoop {
public:
    /**
     * @brief Constructs an EventLoop and starts its worker threads.
     *
     * @param thread_count Number of worker threads (at least 1)
     * @param name Name used in log lines
     */
    explicit EventLoop(int thread_count = 1, std::string name = "eventloop");

    /**
     * @brief Stops the loop and joins all workers. Tasks already running are
     * allowed to finish.
     */
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Signals all worker threads to terminate and discards queued
     * tasks that have not started.
     *
     * Discarded tasks are destroyed before stop() returns, so any cleanup
     * owned by their captures has run by then. Their futures report
     * std::future_errc::broken_promise.
     */
    void stop();

    [[nodiscard]] auto isRunning() const -> bool {
        return !stop_flag_.load(std::memory_order_acquire);
    }

    /**
     * @brief Posts a task with specified priority to the event loop.
     *
     * @param priority Task priority (higher values = higher priority)
     * @param function Callable object to execute
     * @param arguments Arguments to pass to the function
     * @return Future representing the task result
     * @throws std::runtime_error if the loop has been stopped
     */
    template <typename Function, typename... Arguments>
    auto post(int priority, Function&& function, Arguments&&... arguments)
        -> std::future<std::invoke_result_t<Function, Arguments...>>;

    /**
     * @brief Posts a task with default priority (0) to the event loop.
     */
    template <typename Function, typename... Arguments>
    auto post(Function&& function, Arguments&&... arguments)
        -> std::future<std::invoke_result_t<Function, Arguments...>>;

    /**
     * @brief Posts a task that becomes runnable after @p delay.
     */
    template <typename Function, typename... Arguments>
    auto postDelayed(std::chrono::milliseconds delay, Function&& function,
                     Arguments&&... arguments)
        -> std::future<std::invoke_result_t<Function, Arguments...>>;

    /**
     * @brief Number of tasks queued but not yet started.
     */
    [[nodiscard]] auto pendingCount() const -> std::size_t;

    [[nodiscard]] auto name() const -> const std::string& { return name_; }

private:
    struct Task {
        std::function<void()> function;
        int priority;
        std::chrono::steady_clock::time_point execution_time;
        std::uint64_t sequence;

        auto operator<(const Task& other) const -> bool;
    };

    /**
     * @throws std::runtime_error if the loop has been stopped
     */
    void enqueue(std::function<void()> function, int priority,
                 std::chrono::steady_clock::time_point execution_time);

    void workerThread();

    std::string name_;
    std::priority_queue<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_flag_{false};
    std::uint64_t next_sequence_{0};
    std::vector<std::jthread> thread_pool_;
};

// Template Implementation

template <typename Function, typename... Arguments>
auto EventLoop::post(int priority, Function&& function,
                     Arguments&&... arguments)
    -> std::future<std::invoke_result_t<Function, Arguments...>> {
    using return_type = std::invoke_result_t<Function, Arguments...>;
    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<Function>(function),
                  std::forward<Arguments>(arguments)...));
    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); }, priority,
            std::chrono::steady_clock::now());
    return result;
}

template <typename Function, typename... Arguments>
auto EventLoop::post(Function&& function, Arguments&&... arguments)
    -> std::future<std::invoke_result_t<Function, Arguments...>> {
    return post(0, std::forward<Function>(function),
                std::forward<Arguments>(arguments)...);
}

template <typename Function, typename... Arguments>
auto EventLoop::postDelayed(std::chrono::milliseconds delay,
                            Function&& function, Arguments&&... arguments)
    -> std::future<std::invoke_result_t<Function, Arguments...>> {
    using return_type = std::invoke_result_t<Function, Arguments...>;
    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<Function>(function),
                  std::forward<Arguments>(arguments)...));
    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); }, 0,
            std::chrono::steady_clock::now() + delay);
    return result;
}

}  // namespace deq::app

#endif  // DEQ_SERVER_EVENTLOOP_HPP
