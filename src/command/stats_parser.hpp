/*
 * stats_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-12

Description: Parsers for /proc files and the text output of df, lsblk,
smartctl and docker

**************************************************/

#ifndef DEQ_COMMAND_STATS_PARSER_HPP
#define DEQ_COMMAND_STATS_PARSER_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "device/device_types.hpp"

namespace deq::command::stats {

/// Separator printed between sections of the remote snapshot command.
inline constexpr std::string_view kSectionSeparator = "---";

/**
 * @brief Shell snippet that prints nproc, loadavg, meminfo, the first
 * thermal zone and uptime, separated by kSectionSeparator.
 */
auto remoteSnapshotCommand() -> std::string;

/**
 * @brief 1-minute load average relative to the CPU count, capped at 100.
 */
auto parseCpuPercent(std::string_view loadavg, int cpuCount)
    -> std::optional<double>;

/**
 * @brief Fills ramTotal and ramUsed from /proc/meminfo text.
 *
 * Uses MemAvailable when present, otherwise MemFree + Buffers + Cached.
 * @return false when MemTotal is missing
 */
auto parseMemInfo(std::string_view meminfo, device::DeviceStats& stats) -> bool;

/**
 * @brief Whole degrees from a millidegree thermal zone reading.
 */
auto parseThermal(std::string_view text) -> std::optional<double>;

/**
 * @brief "3d 4h" or "4h" from /proc/uptime.
 */
auto parseUptime(std::string_view text) -> std::optional<std::string>;

/**
 * @brief Mounts of interest from `df -B1 --output=source,target,size,used`.
 *
 * Keeps /, /home and anything under /mnt, /media or /srv larger than 1 GB.
 */
auto parseDiskUsage(std::string_view dfOutput) -> std::vector<device::DiskUsage>;

/**
 * @brief Names of whole disks from `lsblk -d -n -o NAME,TYPE`.
 */
auto parseBlockDisks(std::string_view lsblkOutput) -> std::vector<std::string>;

/**
 * @brief Health verdict and temperature from `smartctl -A -H`.
 */
auto parseSmartOutput(std::string_view smartctlOutput) -> device::DiskHealth;

/**
 * @brief Per-container CPU and memory from
 * `docker stats --format '{{.Name}}:{{.CPUPerc}}:{{.MemPerc}}'`.
 */
auto parseContainerStats(std::string_view output)
    -> std::map<std::string, device::ContainerStats>;

/**
 * @brief States of the @p configured containers from
 * `docker ps -a --format '{{.Names}}:{{.State}}'`.
 *
 * Containers absent from the listing are reported as "unknown".
 */
auto parseContainerStates(std::string_view output,
                          const std::vector<std::string>& configured)
    -> std::map<std::string, std::string>;

/**
 * @brief Parses the output of remoteSnapshotCommand().
 * @return std::nullopt when the mandatory sections are malformed
 */
auto parseRemoteSnapshot(std::string_view output)
    -> std::optional<device::DeviceStats>;

/**
 * @brief Every configured container mapped to "unknown".
 */
auto unknownStates(const std::vector<std::string>& configured)
    -> std::map<std::string, std::string>;

}  // namespace deq::command::stats

#endif  // DEQ_COMMAND_STATS_PARSER_HPP
