/*
 * device_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-11

Description: Device records, resource statistics and cached device status

**************************************************/

#ifndef DEQ_DEVICE_DEVICE_TYPES_HPP
#define DEQ_DEVICE_DEVICE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace deq::device {

using json = nlohmann::json;

/**
 * @brief SSH credentials of a remote device
 */
struct SshConfig {
    std::string user;
    int port{22};
};

/**
 * @brief Wake-on-LAN settings of a device
 */
struct WolConfig {
    std::string mac;
    std::string broadcast{"255.255.255.255"};
};

/**
 * @brief Per-device alert thresholds. Values are percentages except the
 * temperatures (degrees Celsius).
 */
struct AlertThresholds {
    bool online{true};       ///< Notify on online/offline transitions
    double cpu{90.0};
    double ram{90.0};
    double cpuTemp{80.0};
    double diskUsage{90.0};
    double diskTemp{60.0};
    bool smart{true};
};

/**
 * @brief A managed machine: the local host or an SSH-reachable remote.
 */
struct Device {
    std::string id;
    std::string name;
    bool isHost{false};
    std::string ip;
    std::optional<SshConfig> ssh;
    std::optional<WolConfig> wol;
    std::vector<std::string> containers;
    std::optional<AlertThresholds> alerts;

    /**
     * @brief Thresholds in effect: the configured ones or the defaults.
     */
    [[nodiscard]] auto effectiveAlerts() const -> AlertThresholds {
        return alerts.value_or(AlertThresholds{});
    }

    [[nodiscard]] auto displayName() const -> const std::string& {
        return name.empty() ? id : name;
    }

    [[nodiscard]] auto hasSshCredentials() const -> bool {
        return ssh.has_value() && !ssh->user.empty();
    }
};

struct DiskUsage {
    std::string mount;
    std::string device;
    std::uint64_t total{0};
    std::uint64_t used{0};

    [[nodiscard]] auto percent() const -> double {
        return total == 0 ? 0.0
                          : static_cast<double>(used) * 100.0 /
                                static_cast<double>(total);
    }
};

enum class SmartState { Unknown, Ok, Failed };

struct DiskHealth {
    std::optional<int> temperature;
    SmartState smart{SmartState::Unknown};
};

struct ContainerStats {
    double cpu{0.0};
    double mem{0.0};
};

/**
 * @brief Resource snapshot of a device at one refresh.
 */
struct DeviceStats {
    double cpu{0.0};
    std::uint64_t ramUsed{0};
    std::uint64_t ramTotal{0};
    std::optional<double> temperature;
    std::string uptime;
    std::vector<DiskUsage> disks;
    std::map<std::string, DiskHealth> diskHealth;
    std::map<std::string, ContainerStats> containerStats;

    [[nodiscard]] auto ramPercent() const -> std::optional<double>;

    /**
     * @brief Highest usage among the reported disks, if any.
     */
    [[nodiscard]] auto maxDiskPercent() const -> std::optional<double>;
};

enum class OnlineState { Unknown, Online, Offline };

/**
 * @brief Last observed state of a device as kept by the status cache.
 */
struct DeviceStatus {
    OnlineState online{OnlineState::Unknown};
    std::optional<DeviceStats> stats;
    std::map<std::string, std::string> containers;  ///< name -> state
    std::chrono::system_clock::time_point updatedAt{};

    [[nodiscard]] auto isOnline() const -> bool {
        return online == OnlineState::Online;
    }
};

inline constexpr std::string_view kContainerRunning = "running";
inline constexpr std::string_view kContainerUnknown = "unknown";

auto smartStateToString(SmartState state) -> std::string_view;
auto smartStateFromString(std::string_view text) -> SmartState;

void to_json(json& j, const SshConfig& ssh);
void from_json(const json& j, SshConfig& ssh);
void to_json(json& j, const WolConfig& wol);
void from_json(const json& j, WolConfig& wol);
void to_json(json& j, const AlertThresholds& alerts);
void from_json(const json& j, AlertThresholds& alerts);
void to_json(json& j, const Device& device);
void from_json(const json& j, Device& device);

void to_json(json& j, const DiskUsage& disk);
void to_json(json& j, const DeviceStats& stats);
void to_json(json& j, const DeviceStatus& status);

}  // namespace deq::device

#endif  // DEQ_DEVICE_DEVICE_TYPES_HPP
