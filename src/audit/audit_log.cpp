/*
 * audit_log.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "audit_log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>

namespace deq::audit {

auto auditActionToString(AuditAction action) -> std::string_view {
    switch (action) {
        case AuditAction::DeviceWake:
            return "device.wake";
        case AuditAction::DeviceShutdown:
            return "device.shutdown";
        case AuditAction::DeviceStatus:
            return "device.status";
        case AuditAction::DockerStart:
            return "docker.start";
        case AuditAction::DockerStop:
            return "docker.stop";
        case AuditAction::ConfigUpdate:
            return "config.update";
        case AuditAction::NotificationTest:
            return "notification.test";
        case AuditAction::TaskRun:
            return "task.run";
        case AuditAction::TaskComplete:
            return "task.complete";
        case AuditAction::TaskFailed:
            return "task.failed";
        case AuditAction::ServerStart:
            return "server.start";
        case AuditAction::ServerStop:
            return "server.stop";
    }
    return "unknown";
}

auto auditResultToString(AuditResult result) -> std::string_view {
    switch (result) {
        case AuditResult::Success:
            return "success";
        case AuditResult::Failure:
            return "failure";
    }
    return "unknown";
}

auto makeAuditEntry(AuditAction action, AuditResult result,
                    const json& target, const utils::RequestContext& ctx,
                    const json& details, utils::TimePoint at) -> json {
    json entry = {
        {"timestamp", utils::toUtcIsoString(at)},
        {"level", result == AuditResult::Success ? "INFO" : "WARN"},
        {"action", auditActionToString(action)},
        {"result", auditResultToString(result)}};
    if (!target.is_null()) {
        entry["target"] = target;
    }
    if (!details.is_null()) {
        entry["details"] = details;
    }
    if (!ctx.requestId.empty()) {
        entry["request_id"] = ctx.requestId;
    }
    if (!ctx.sourceIp.empty()) {
        entry["source_ip"] = ctx.sourceIp;
    }
    return entry;
}

AuditLog::AuditLog(std::filesystem::path file, std::size_t maxSize,
                   std::size_t maxFiles)
    : path_(std::move(file)) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
    if (ec) {
        spdlog::warn("Cannot create audit log directory {}: {}",
                     path_.parent_path().string(), ec.message());
        return;
    }
    try {
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path_.string(), maxSize, maxFiles);
        logger_ = std::make_shared<spdlog::logger>("audit", std::move(sink));
        logger_->set_pattern("%v");
        logger_->set_level(spdlog::level::info);
        logger_->flush_on(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("Cannot open audit log {}: {}", path_.string(), e.what());
        logger_.reset();
    }
}

AuditLog::~AuditLog() { flush(); }

void AuditLog::record(AuditAction action, AuditResult result,
                      const json& target, const utils::RequestContext& ctx,
                      const json& details) {
    auto line = makeAuditEntry(action, result, target, ctx, details,
                               utils::Clock::now())
                    .dump(-1, ' ', false, json::error_handler_t::replace);
    if (logger_) {
        logger_->info("{}", line);
    } else {
        spdlog::info("[audit] {}", line);
    }
}

void AuditLog::flush() {
    if (logger_) {
        logger_->flush();
    }
}

}  // namespace deq::audit
