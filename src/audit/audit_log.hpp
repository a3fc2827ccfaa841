/*
 * audit_log.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-21

Description: Structured audit trail of state-changing actions, one JSON
object per line

**************************************************/

#ifndef DEQ_AUDIT_AUDIT_LOG_HPP
#define DEQ_AUDIT_AUDIT_LOG_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/request_context.hpp"
#include "utils/time_utils.hpp"

namespace deq::audit {

using json = nlohmann::json;

enum class AuditAction {
    DeviceWake,
    DeviceShutdown,
    DeviceStatus,
    DockerStart,
    DockerStop,
    ConfigUpdate,
    NotificationTest,
    TaskRun,
    TaskComplete,
    TaskFailed,
    ServerStart,
    ServerStop
};

/**
 * @brief Dotted wire name, e.g. "docker.start".
 */
[[nodiscard]] auto auditActionToString(AuditAction action) -> std::string_view;

enum class AuditResult { Success, Failure };

[[nodiscard]] auto auditResultToString(AuditResult result) -> std::string_view;

/**
 * @brief Builds one audit record.
 *
 * Fields: timestamp (UTC), level, action, result, and when present target,
 * details, request_id and source_ip. Empty context fields and null
 * target/details are left out.
 */
[[nodiscard]] auto makeAuditEntry(AuditAction action, AuditResult result,
                                  const json& target,
                                  const utils::RequestContext& ctx,
                                  const json& details, utils::TimePoint at)
    -> json;

/**
 * @brief Appends audit records to a size-rotated file.
 *
 * Writing never throws: if the file cannot be opened the records go to the
 * main log instead.
 */
class AuditLog {
public:
    static constexpr std::size_t kDefaultMaxSize = 10 * 1024 * 1024;

    explicit AuditLog(std::filesystem::path file,
                      std::size_t maxSize = kDefaultMaxSize,
                      std::size_t maxFiles = 1);
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void record(AuditAction action, AuditResult result, const json& target,
                const utils::RequestContext& ctx,
                const json& details = nullptr);

    void flush();

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

private:
    std::filesystem::path path_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace deq::audit

#endif  // DEQ_AUDIT_AUDIT_LOG_HPP
