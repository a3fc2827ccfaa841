/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-19

Description: Entry point of the deq daemon

**************************************************/

#include <algorithm>
#include <any>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/system/crash.hpp"
#include "atom/utils/argsview.hpp"

#include "audit/audit_log.hpp"
#include "command/system_executor.hpp"
#include "config/config_store.hpp"
#include "config/exception.hpp"
#include "device/status_cache.hpp"
#include "notify/notification_manager.hpp"
#include "server/dashboard.hpp"
#include "server/eventloop.hpp"
#include "task/scheduler.hpp"
#include "task/task_runner.hpp"
#include "utils/logging/spdlog_config.hpp"

using namespace std::string_literals;
namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_stopRequested{false};

extern "C" void handleSignal(int /*signal*/) {
    g_stopRequested.store(true);
}

void waitFor(std::chrono::seconds duration) {
    auto waited = std::chrono::seconds(0);
    while (waited < duration && !g_stopRequested.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        waited += std::chrono::seconds(1);
    }
}

}  // namespace

int main(int argc, char *argv[]) {
    atom::utils::ArgumentParser program("DeQ Homelab Dashboard"s);

    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "config.json"s, "Path to the config file",
                        {"c"});
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        "info"s, "Log level (trace/debug/info/warn/error)",
                        {"l"});
    program.addArgument("poll-interval",
                        atom::utils::ArgumentParser::ArgType::INTEGER, false,
                        60, "Seconds between task schedule checks", {"p"});
    program.addArgument("refresh-interval",
                        atom::utils::ArgumentParser::ArgType::INTEGER, false,
                        30, "Seconds between background status refreshes",
                        {"r"});
    program.addArgument("staging-dir",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        fs::temp_directory_path().string(),
                        "Scratch directory for remote to remote backups",
                        {"s"});
    program.addArgument("task-log-dir",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        "task-logs"s, "Directory of per-task run logs", {"t"});
    program.addArgument("audit-log",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        "logs/audit.log"s, "Audit trail of state changes",
                        {"a"});

    program.addDescription("DeQ Command Line Interface:");
    program.addEpilog("End.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    deq::logging::LoggerConfig logConfig;
    try {
        logConfig.level = deq::logging::LogConfig::parseLevel(
            program.get<std::string>("log-level").value_or("info"s));
    } catch (const std::bad_any_cast &e) {
        spdlog::error("Invalid args format! Error: {}", e.what());
        return 1;
    }
    deq::logging::LogConfig::initialize(logConfig);

    std::string configPath;
    std::string stagingDir;
    std::string taskLogDir;
    std::string auditPath;
    int pollInterval = 60;
    int refreshInterval = 30;
    try {
        configPath = program.get<std::string>("config").value_or("config.json"s);
        stagingDir = program.get<std::string>("staging-dir")
                         .value_or(fs::temp_directory_path().string());
        taskLogDir =
            program.get<std::string>("task-log-dir").value_or("task-logs"s);
        auditPath =
            program.get<std::string>("audit-log").value_or("logs/audit.log"s);
        pollInterval = program.get<int>("poll-interval").value_or(60);
        refreshInterval = program.get<int>("refresh-interval").value_or(30);
    } catch (const std::bad_any_cast &e) {
        spdlog::error("Invalid args format! Error: {}", e.what());
        atom::system::saveCrashLog(e.what());
        return 1;
    }

    auto store = std::make_shared<deq::config::JsonConfigStore>(configPath);
    try {
        store->load();
        // Persist merged defaults and the host device on first start.
        store->save();
    } catch (const deq::config::ConfigIOException &e) {
        spdlog::critical("Cannot access configuration: {}", e.what());
        atom::system::saveCrashLog(e.what());
        return 1;
    } catch (const deq::config::BadConfigException &e) {
        spdlog::critical("Configuration is not valid: {}", e.what());
        atom::system::saveCrashLog(e.what());
        return 1;
    }
    spdlog::info("Loaded {} devices and {} tasks from {}",
                 store->listDevices().size(), store->listTasks().size(),
                 configPath);

    auto notifier = std::make_shared<deq::notify::NotificationManager>(
        store->notificationSettings());
    auto executor =
        std::make_shared<deq::command::SystemCommandExecutor>(stagingDir);

    // Separate pools so a long backup never delays status refreshes.
    auto refreshLoop = std::make_shared<deq::app::EventLoop>(4, "refresh");
    auto taskLoop = std::make_shared<deq::app::EventLoop>(2, "tasks");

    auto auditLog = std::make_shared<deq::audit::AuditLog>(auditPath);

    auto cache = std::make_shared<deq::device::DeviceStatusCache>(
        executor, notifier, refreshLoop);
    auto runner = std::make_shared<deq::task::TaskRunner>(
        store, executor, notifier, taskLoop, taskLogDir, auditLog);
    auto scheduler = std::make_shared<deq::task::TaskScheduler>(
        store, runner, std::chrono::seconds(pollInterval));
    auto dashboard = std::make_unique<deq::server::Dashboard>(
        store, cache, scheduler, executor, notifier, auditLog);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const deq::utils::RequestContext internal{};
    auditLog->record(deq::audit::AuditAction::ServerStart,
                     deq::audit::AuditResult::Success, nullptr, internal);
    scheduler->start();
    spdlog::info("DeQ started, refreshing every {}s", refreshInterval);

    while (!g_stopRequested.load()) {
        auto started = cache->refreshAll(store->listDevices(), internal);
        spdlog::debug("Queued {} status refreshes", started);
        waitFor(std::chrono::seconds(std::max(refreshInterval, 1)));
        spdlog::trace("Statuses: {}", dashboard->allStatuses().dump());
    }

    spdlog::info("Shutting down");
    scheduler->stop();

    // Clients first: the loops must be destroyed here, on the main thread,
    // after their workers have finished whatever they were running.
    dashboard.reset();
    scheduler.reset();
    runner.reset();
    cache.reset();
    refreshLoop->stop();
    taskLoop->stop();
    refreshLoop.reset();
    taskLoop.reset();

    auditLog->record(deq::audit::AuditAction::ServerStop,
                     deq::audit::AuditResult::Success, nullptr, internal);
    deq::logging::LogConfig::flushAll();
    return 0;
}
