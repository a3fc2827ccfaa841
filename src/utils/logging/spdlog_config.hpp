/*
 * spdlog_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration for the dashboard daemon

**************************************************/

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace deq::logging {

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

struct LoggerConfig {
    std::string name{"deq"};
    LogLevel level = LogLevel::INFO;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
    bool console_output = true;
    bool file_output = true;
    std::string log_file_path = "logs/deq.log";
    std::size_t max_file_size = 1048576 * 10;  // 10MB
    std::size_t max_files = 5;
    bool flush_on_error = true;
    std::chrono::seconds flush_interval{3};
};

/**
 * @brief Process-wide spdlog setup
 */
class LogConfig {
public:
    /**
     * @brief Install the default logger (console + rotating file)
     * @param config Logger configuration
     *
     * Calling it a second time is a no-op.
     */
    static void initialize(const LoggerConfig& config = LoggerConfig{});

    /**
     * @brief Get or create a named logger sharing the default sinks
     * @param name Logger name
     * @return Shared pointer to logger
     */
    static auto getLogger(std::string_view name)
        -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Set global log level
     * @param level New log level
     */
    static void setGlobalLevel(LogLevel level) noexcept;

    /**
     * @brief Flush all loggers
     */
    static void flushAll() noexcept;

    /**
     * @brief Parse "trace", "debug", "info", "warn", "error", "critical",
     * "off". Unknown text maps to INFO.
     */
    static auto parseLevel(std::string_view text) noexcept -> LogLevel;

    static auto convertLevel(LogLevel level) noexcept
        -> spdlog::level::level_enum;

private:
    static inline std::atomic<bool> initialized_{false};
};

}  // namespace deq::logging
