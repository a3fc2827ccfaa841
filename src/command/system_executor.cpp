/*
 * system_executor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "system_executor.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <thread>

#include <spdlog/spdlog.h>

#include "rsync.hpp"
#include "stats_parser.hpp"
#include "wake_on_lan.hpp"

namespace deq::command {

using namespace std::chrono_literals;

namespace {

constexpr auto kPingTimeout = 3s;
constexpr auto kRemoteSnapshotTimeout = 10s;
constexpr auto kRemoteOptionalTimeout = 5s;
constexpr auto kLocalQueryTimeout = 5s;
constexpr auto kSmartctlTimeout = 10s;
constexpr auto kDockerStatsTimeout = 10s;
constexpr auto kDockerPsLocalTimeout = 5s;
constexpr auto kDockerPsRemoteTimeout = 15s;
constexpr auto kDockerActionTimeout = 60s;
constexpr auto kShutdownTimeout = 30s;

auto readFile(const std::filesystem::path& path) -> std::optional<std::string> {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

auto containsIgnoreCase(std::string_view haystack, std::string_view needle)
    -> bool {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                          needle.end(), [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

// Leading part of a command's output, for error reporting.
auto errorExcerpt(const std::string& output, std::size_t limit,
                  std::string fallback) -> std::string {
    auto first = output.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return fallback;
    }
    auto last = output.find_last_not_of(" \t\r\n");
    auto text = output.substr(first, last - first + 1);
    if (text.size() > limit) {
        text.resize(limit);
    }
    return text;
}

}  // namespace

auto containerActionName(ContainerAction action) -> const char* {
    switch (action) {
        case ContainerAction::Start:
            return "start";
        case ContainerAction::Stop:
            return "stop";
    }
    return "start";
}

SystemCommandExecutor::SystemCommandExecutor(std::filesystem::path stagingRoot)
    : stagingRoot_(std::move(stagingRoot)) {}

auto SystemCommandExecutor::probe(const device::Device& device) -> bool {
    if (device.isHost) {
        return true;
    }
    if (!isValidIpAddress(device.ip)) {
        spdlog::warn("Refusing to ping device {}: invalid address '{}'",
                     device.id, device.ip);
        return false;
    }
    return runProcess({"ping", "-c", "1", "-W", "1", device.ip}, kPingTimeout)
        .ok();
}

auto SystemCommandExecutor::fetchStats(const device::Device& device)
    -> std::optional<device::DeviceStats> {
    if (device.isHost) {
        return localStats();
    }
    return remoteStats(device);
}

auto SystemCommandExecutor::localStats() -> device::DeviceStats {
    device::DeviceStats stats;

    int cpuCount = static_cast<int>(std::thread::hardware_concurrency());
    if (auto loadavg = readFile("/proc/loadavg")) {
        stats.cpu = stats::parseCpuPercent(*loadavg, cpuCount).value_or(0.0);
    }
    if (auto meminfo = readFile("/proc/meminfo")) {
        stats::parseMemInfo(*meminfo, stats);
    }
    if (auto thermal = readFile("/sys/class/thermal/thermal_zone0/temp")) {
        stats.temperature = stats::parseThermal(*thermal);
    }
    if (auto uptime = readFile("/proc/uptime")) {
        stats.uptime = stats::parseUptime(*uptime).value_or("");
    }

    auto df = runProcess({"df", "-B1", "--output=source,target,size,used"},
                         kLocalQueryTimeout);
    if (df.ok()) {
        stats.disks = stats::parseDiskUsage(df.output);
    }

    auto lsblk =
        runProcess({"lsblk", "-d", "-n", "-o", "NAME,TYPE"}, kLocalQueryTimeout);
    if (lsblk.ok()) {
        for (const auto& disk : stats::parseBlockDisks(lsblk.output)) {
            // smartctl uses non-zero exit bits for warnings, so parse anyway.
            auto smart = runProcess(
                {"sudo", "-n", "smartctl", "-A", "-H", "/dev/" + disk},
                kSmartctlTimeout);
            stats.diskHealth[disk] =
                smart.timedOut ? device::DiskHealth{}
                               : stats::parseSmartOutput(smart.output);
        }
    }

    auto docker = runProcess({"docker", "stats", "--no-stream", "--format",
                              "{{.Name}}:{{.CPUPerc}}:{{.MemPerc}}"},
                             kDockerStatsTimeout);
    if (docker.ok()) {
        stats.containerStats = stats::parseContainerStats(docker.output);
    }
    return stats;
}

auto SystemCommandExecutor::remoteStats(const device::Device& device)
    -> std::optional<device::DeviceStats> {
    if (auto problem = validateSshTarget(device); !problem.empty()) {
        spdlog::debug("No stats for {}: {}", device.id, problem);
        return std::nullopt;
    }

    auto snapshot = runRemote(device, stats::remoteSnapshotCommand(),
                              kRemoteSnapshotTimeout, 3);
    if (!snapshot.ok()) {
        spdlog::debug("Stats query for {} failed (exit {})", device.id,
                      snapshot.exitCode);
        return std::nullopt;
    }
    auto stats = stats::parseRemoteSnapshot(snapshot.output);
    if (!stats) {
        spdlog::warn("Unparseable stats snapshot from {}", device.id);
        return std::nullopt;
    }

    auto df = runRemote(device,
                        "df -B1 --output=source,target,size,used 2>/dev/null",
                        kRemoteOptionalTimeout, 3);
    if (df.ok()) {
        stats->disks = stats::parseDiskUsage(df.output);
    }

    auto lsblk = runRemote(device, "lsblk -d -n -o NAME,TYPE 2>/dev/null",
                           kRemoteOptionalTimeout, 3);
    if (lsblk.ok()) {
        for (const auto& disk : stats::parseBlockDisks(lsblk.output)) {
            if (!isValidContainerName(disk)) {
                continue;
            }
            auto smart = runRemote(
                device, "sudo -n smartctl -A -H /dev/" + disk + " 2>/dev/null",
                kRemoteOptionalTimeout, 3);
            stats->diskHealth[disk] =
                smart.timedOut ? device::DiskHealth{}
                               : stats::parseSmartOutput(smart.output);
        }
    }

    auto docker = runRemote(device,
                            "docker stats --no-stream --format "
                            "'{{.Name}}:{{.CPUPerc}}:{{.MemPerc}}' 2>/dev/null",
                            kRemoteOptionalTimeout, 3);
    if (docker.ok()) {
        stats->containerStats = stats::parseContainerStats(docker.output);
    }
    return stats;
}

auto SystemCommandExecutor::runRemoteDocker(const device::Device& device,
                                            const std::string& dockerArgs,
                                            std::chrono::seconds timeout)
    -> ProcessResult {
    auto result = runRemote(device, "docker " + dockerArgs, timeout);
    if (!result.timedOut &&
        containsIgnoreCase(result.output, "permission denied")) {
        spdlog::debug("Docker on {} needs sudo, retrying", device.id);
        result = runRemote(device, "sudo -n docker " + dockerArgs, timeout);
    }
    return result;
}

auto SystemCommandExecutor::fetchContainerStates(const device::Device& device)
    -> std::map<std::string, std::string> {
    if (device.containers.empty()) {
        return {};
    }

    ProcessResult result;
    if (device.isHost) {
        result = runProcess(
            {"docker", "ps", "-a", "--format", "{{.Names}}:{{.State}}"},
            kDockerPsLocalTimeout);
    } else {
        if (!device.hasSshCredentials()) {
            return stats::unknownStates(device.containers);
        }
        result = runRemoteDocker(device,
                                 "ps -a --format '{{.Names}}:{{.State}}'",
                                 kDockerPsRemoteTimeout);
    }

    if (!result.ok()) {
        spdlog::debug("Container listing on {} failed (exit {})", device.id,
                      result.exitCode);
        return stats::unknownStates(device.containers);
    }
    return stats::parseContainerStates(result.output, device.containers);
}

auto SystemCommandExecutor::runAction(const device::Device& device,
                                      const std::string& container,
                                      ContainerAction action) -> CommandResult {
    if (!isValidContainerName(container)) {
        return CommandResult::fail("Invalid container name");
    }
    const std::string verb = containerActionName(action);

    ProcessResult result;
    if (device.isHost) {
        result = runProcess({"docker", verb, container}, kDockerActionTimeout);
    } else {
        result = runRemoteDocker(device, verb + " " + shellQuote(container),
                                 kDockerActionTimeout);
        if (!result.timedOut &&
            containsIgnoreCase(result.output, "permission denied")) {
            return CommandResult::fail("Docker permission denied");
        }
    }

    if (result.timedOut) {
        return CommandResult::fail(device.isHost
                                       ? "docker " + verb + " timed out"
                                       : std::string("SSH timeout"));
    }
    if (!result.ok()) {
        return CommandResult::fail(
            errorExcerpt(result.output, 100, "docker " + verb + " failed"));
    }
    spdlog::info("docker {} {} on {} succeeded", verb, container, device.id);
    return CommandResult::ok();
}

auto SystemCommandExecutor::sync(const device::Device& source,
                                 const std::string& sourcePath,
                                 const device::Device& destination,
                                 const std::string& destinationPath,
                                 const SyncOptions& options) -> SyncResult {
    SyncResult outcome;
    for (const auto* end : {&source, &destination}) {
        if (!end->isHost && !isValidIpAddress(end->ip)) {
            outcome.error = "Invalid IP address for " + end->id;
            return outcome;
        }
    }
    if (!isValidRemotePath(sourcePath) || !isValidRemotePath(destinationPath)) {
        outcome.error = "Invalid path";
        return outcome;
    }

    std::optional<rsync::StagingArea> staging;
    std::filesystem::path stagingPath;
    if (!source.isHost && !destination.isHost) {
        staging.emplace(stagingRoot_);
        if (!staging->ready()) {
            outcome.error = "Could not create staging directory";
            return outcome;
        }
        stagingPath = staging->path();
    }

    auto plan = rsync::planSync(source, sourcePath, destination,
                                destinationPath, options.deleteExtraneous,
                                stagingPath);
    if (plan.localDestination && !plan.staged) {
        std::error_code ec;
        std::filesystem::create_directories(*plan.localDestination, ec);
        if (ec) {
            outcome.error = "Cannot create " + plan.localDestination->string() +
                            ": " + ec.message();
            return outcome;
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    std::string lastOutput;
    for (const auto& leg : plan.legs) {
        auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining <= 0s) {
            outcome.timedOut = true;
            outcome.error = "timeout";
            return outcome;
        }
        spdlog::info("Running: {}", joinArgs(leg));
        auto result = runProcess(leg, remaining);
        if (result.timedOut) {
            outcome.timedOut = true;
            outcome.error = "timeout";
            return outcome;
        }
        if (!result.ok()) {
            outcome.error = errorExcerpt(result.output, 200, "rsync failed");
            return outcome;
        }
        lastOutput = std::move(result.output);
    }

    outcome.success = true;
    outcome.sizeSummary = rsync::parseTransferSize(lastOutput);
    return outcome;
}

auto SystemCommandExecutor::wakeOnLan(const std::string& mac,
                                      const std::string& broadcast)
    -> CommandResult {
    if (!isValidMacAddress(mac)) {
        return CommandResult::fail("Invalid MAC address");
    }
    if (auto error = wol::sendMagicPacket(mac, broadcast); !error.empty()) {
        return CommandResult::fail(std::move(error));
    }
    return CommandResult::ok();
}

auto SystemCommandExecutor::shutdown(const device::Device& device)
    -> CommandResult {
    if (device.isHost) {
        auto result =
            runProcess({"sudo", "-n", "shutdown", "-h", "now"}, kShutdownTimeout);
        if (!result.ok()) {
            return CommandResult::fail(
                errorExcerpt(result.output, 200, "shutdown failed"));
        }
        return CommandResult::ok();
    }

    if (auto problem = validateSshTarget(device); !problem.empty()) {
        return CommandResult::fail(std::move(problem));
    }
    // The connection usually drops before ssh can report a status, so
    // anything short of a validation failure counts as issued.
    auto result = runRemote(device, "sudo shutdown -h now", kShutdownTimeout);
    spdlog::info("Shutdown issued to {} (exit {}{})", device.id,
                 result.exitCode, result.timedOut ? ", timed out" : "");
    return CommandResult::ok();
}

}  // namespace deq::command
