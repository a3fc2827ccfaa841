/*
 * device_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_types.hpp"

#include <algorithm>

namespace deq::device {

auto DeviceStats::ramPercent() const -> std::optional<double> {
    if (ramTotal == 0) {
        return std::nullopt;
    }
    return static_cast<double>(ramUsed) * 100.0 /
           static_cast<double>(ramTotal);
}

auto DeviceStats::maxDiskPercent() const -> std::optional<double> {
    if (disks.empty()) {
        return std::nullopt;
    }
    double highest = 0.0;
    for (const auto& disk : disks) {
        highest = std::max(highest, disk.percent());
    }
    return highest;
}

auto smartStateToString(SmartState state) -> std::string_view {
    switch (state) {
        case SmartState::Ok:
            return "ok";
        case SmartState::Failed:
            return "failed";
        case SmartState::Unknown:
            return "unknown";
    }
    return "unknown";
}

auto smartStateFromString(std::string_view text) -> SmartState {
    if (text == "ok") return SmartState::Ok;
    if (text == "failed") return SmartState::Failed;
    return SmartState::Unknown;
}

void to_json(json& j, const SshConfig& ssh) {
    j = json{{"user", ssh.user}, {"port", ssh.port}};
}

void from_json(const json& j, SshConfig& ssh) {
    ssh.user = j.value("user", std::string{});
    ssh.port = j.value("port", 22);
}

void to_json(json& j, const WolConfig& wol) {
    j = json{{"mac", wol.mac}, {"broadcast", wol.broadcast}};
}

void from_json(const json& j, WolConfig& wol) {
    wol.mac = j.value("mac", std::string{});
    wol.broadcast = j.value("broadcast", std::string{"255.255.255.255"});
    if (wol.broadcast.empty()) {
        wol.broadcast = "255.255.255.255";
    }
}

void to_json(json& j, const AlertThresholds& alerts) {
    j = json{{"online", alerts.online},       {"cpu", alerts.cpu},
             {"ram", alerts.ram},             {"cpu_temp", alerts.cpuTemp},
             {"disk_usage", alerts.diskUsage}, {"disk_temp", alerts.diskTemp},
             {"smart", alerts.smart}};
}

void from_json(const json& j, AlertThresholds& alerts) {
    const AlertThresholds defaults;
    alerts.online = j.value("online", defaults.online);
    alerts.cpu = j.value("cpu", defaults.cpu);
    alerts.ram = j.value("ram", defaults.ram);
    alerts.cpuTemp = j.value("cpu_temp", defaults.cpuTemp);
    alerts.diskUsage = j.value("disk_usage", defaults.diskUsage);
    alerts.diskTemp = j.value("disk_temp", defaults.diskTemp);
    alerts.smart = j.value("smart", defaults.smart);
}

void to_json(json& j, const Device& device) {
    j = json{{"id", device.id},
             {"name", device.displayName()},
             {"is_host", device.isHost},
             {"ip", device.ip},
             {"alerts", device.effectiveAlerts()}};
    if (device.ssh) {
        j["ssh"] = *device.ssh;
    }
    if (device.wol) {
        j["wol"] = *device.wol;
    }
    if (!device.containers.empty()) {
        j["docker"] = json{{"containers", device.containers}};
    }
}

void from_json(const json& j, Device& device) {
    device.id = j.at("id").get<std::string>();
    device.name = j.value("name", std::string{});
    device.isHost = j.value("is_host", false);
    device.ip = j.value("ip", std::string{});

    device.ssh.reset();
    if (auto it = j.find("ssh"); it != j.end() && it->is_object()) {
        device.ssh = it->get<SshConfig>();
    }
    device.wol.reset();
    if (auto it = j.find("wol"); it != j.end() && it->is_object()) {
        device.wol = it->get<WolConfig>();
    }
    device.alerts.reset();
    if (auto it = j.find("alerts"); it != j.end() && it->is_object()) {
        device.alerts = it->get<AlertThresholds>();
    }

    device.containers.clear();
    if (auto docker = j.find("docker"); docker != j.end() && docker->is_object()) {
        if (auto list = docker->find("containers");
            list != docker->end() && list->is_array()) {
            for (const auto& entry : *list) {
                if (entry.is_string()) {
                    device.containers.push_back(entry.get<std::string>());
                } else if (entry.is_object() && entry.contains("name")) {
                    device.containers.push_back(
                        entry.at("name").get<std::string>());
                }
            }
        }
    }
}

void to_json(json& j, const DiskUsage& disk) {
    j = json{{"mount", disk.mount},
             {"device", disk.device},
             {"total", disk.total},
             {"used", disk.used}};
}

void to_json(json& j, const DeviceStats& stats) {
    j = json{{"cpu", stats.cpu},
             {"ram_used", stats.ramUsed},
             {"ram_total", stats.ramTotal},
             {"uptime", stats.uptime},
             {"disks", stats.disks}};
    j["temp"] = stats.temperature ? json(*stats.temperature) : json(nullptr);

    json smart = json::object();
    for (const auto& [name, health] : stats.diskHealth) {
        smart[name] = json{
            {"temp", health.temperature ? json(*health.temperature)
                                        : json(nullptr)},
            {"smart", std::string(smartStateToString(health.smart))}};
    }
    j["disk_smart"] = std::move(smart);

    json containers = json::object();
    for (const auto& [name, usage] : stats.containerStats) {
        containers[name] = json{{"cpu", usage.cpu}, {"mem", usage.mem}};
    }
    j["container_stats"] = std::move(containers);
}

void to_json(json& j, const DeviceStatus& status) {
    switch (status.online) {
        case OnlineState::Online:
            j["online"] = true;
            break;
        case OnlineState::Offline:
            j["online"] = false;
            break;
        case OnlineState::Unknown:
            j["online"] = nullptr;
            break;
    }
    j["stats"] = status.stats ? json(*status.stats) : json(nullptr);
    j["containers"] = status.containers;
}

}  // namespace deq::device
