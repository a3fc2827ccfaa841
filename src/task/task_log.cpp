/*
 * task_log.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "task_log.hpp"

#include <spdlog/sinks/basic_file_sink.h>

namespace deq::task {

namespace {
constexpr const char* kTaskLogPattern = "[%Y-%m-%d %H:%M:%S] %v";
}

TaskLog::TaskLog(const std::filesystem::path& directory,
                 const std::string& taskId)
    : path_(directory / (taskId + ".log")) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        spdlog::warn("Cannot create task log directory {}: {}",
                     directory.string(), ec.message());
        return;
    }
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            path_.string(), false);
        // Not registered: every run gets its own short-lived logger.
        logger_ = std::make_shared<spdlog::logger>("task-" + taskId,
                                                   std::move(sink));
        logger_->set_pattern(kTaskLogPattern);
        logger_->set_level(spdlog::level::info);
        logger_->flush_on(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("Cannot open task log {}: {}", path_.string(), e.what());
        logger_.reset();
    }
}

TaskLog::~TaskLog() {
    if (logger_) {
        logger_->flush();
    }
}

}  // namespace deq::task
