/*
 * spdlog_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-29

Description: Global spdlog configuration implementation

**************************************************/

#include "spdlog_config.hpp"

#include <cstdio>
#include <filesystem>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace deq::logging {

namespace {
std::vector<spdlog::sink_ptr> shared_sinks_;
}

void LogConfig::initialize(const LoggerConfig& config) {
    if (initialized_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console_output) {
            auto console_sink =
                std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(convertLevel(config.level));
            console_sink->set_pattern(config.pattern);
            sinks.push_back(console_sink);
        }

        if (config.file_output) {
            auto parent =
                std::filesystem::path(config.log_file_path).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto file_sink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.log_file_path, config.max_file_size,
                    config.max_files);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern(
                "[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] [%n] %v");
            sinks.push_back(file_sink);
        }

        shared_sinks_ = sinks;

        auto logger = std::make_shared<spdlog::logger>(
            config.name, sinks.begin(), sinks.end());
        logger->set_level(convertLevel(config.level));
        if (config.flush_on_error) {
            logger->flush_on(spdlog::level::err);
        }
        spdlog::set_default_logger(logger);
        spdlog::flush_every(config.flush_interval);

        spdlog::set_error_handler([](const std::string& msg) {
            std::fprintf(stderr, "spdlog error: %s\n", msg.c_str());
        });

        spdlog::info("Logging initialized (level {}, file {})",
                     spdlog::level::to_string_view(convertLevel(config.level)),
                     config.file_output ? config.log_file_path : "disabled");
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        initialized_.store(false, std::memory_order_release);
        throw;
    }
}

auto LogConfig::getLogger(std::string_view name)
    -> std::shared_ptr<spdlog::logger> {
    std::string nameStr{name};
    if (auto existing = spdlog::get(nameStr)) {
        return existing;
    }

    std::shared_ptr<spdlog::logger> logger;
    if (shared_sinks_.empty()) {
        logger = std::make_shared<spdlog::logger>(
            nameStr, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    } else {
        logger = std::make_shared<spdlog::logger>(
            nameStr, shared_sinks_.begin(), shared_sinks_.end());
    }
    logger->set_level(spdlog::default_logger()->level());

    try {
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        // Registered concurrently by another thread.
        return spdlog::get(nameStr);
    }
    return logger;
}

void LogConfig::setGlobalLevel(LogLevel level) noexcept {
    spdlog::set_level(convertLevel(level));
}

void LogConfig::flushAll() noexcept {
    spdlog::apply_all(
        [](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
}

auto LogConfig::parseLevel(std::string_view text) noexcept -> LogLevel {
    if (text == "trace") return LogLevel::TRACE;
    if (text == "debug") return LogLevel::DEBUG;
    if (text == "info") return LogLevel::INFO;
    if (text == "warn" || text == "warning") return LogLevel::WARN;
    if (text == "error" || text == "err") return LogLevel::ERROR;
    if (text == "critical" || text == "fatal") return LogLevel::CRITICAL;
    if (text == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

auto LogConfig::convertLevel(LogLevel level) noexcept
    -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::TRACE:
            return spdlog::level::trace;
        case LogLevel::DEBUG:
            return spdlog::level::debug;
        case LogLevel::INFO:
            return spdlog::level::info;
        case LogLevel::WARN:
            return spdlog::level::warn;
        case LogLevel::ERROR:
            return spdlog::level::err;
        case LogLevel::CRITICAL:
            return spdlog::level::critical;
        case LogLevel::OFF:
            return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace deq::logging
