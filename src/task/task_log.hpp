/*
 * task_log.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef DEQ_TASK_TASK_LOG_HPP
#define DEQ_TASK_TASK_LOG_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace deq::task {

/**
 * @brief Append-only run log of one task, kept at <dir>/<task id>.log.
 *
 * Lines look like "[2025-02-18 03:00:01] Completed successfully". When the
 * file cannot be opened the log degrades to a no-op and a warning goes to
 * the main log instead.
 */
class TaskLog {
public:
    TaskLog(const std::filesystem::path& directory, const std::string& taskId);
    ~TaskLog();

    TaskLog(const TaskLog&) = delete;
    TaskLog& operator=(const TaskLog&) = delete;

    template <typename... Args>
    void write(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    [[nodiscard]] auto isOpen() const -> bool { return logger_ != nullptr; }

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

private:
    std::filesystem::path path_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace deq::task

#endif  // DEQ_TASK_TASK_LOG_HPP
