/*
 * stats_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "stats_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>

namespace deq::command::stats {

namespace {

constexpr std::uint64_t kMinDiskSize = 1'000'000'000ULL;

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

auto splitLines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = trim(text.substr(start, end - start));
        if (!line.empty()) {
            lines.push_back(line);
        }
        start = end + 1;
    }
    return lines;
}

auto splitFields(std::string_view line) -> std::vector<std::string_view> {
    std::vector<std::string_view> fields;
    std::size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() &&
               std::isspace(static_cast<unsigned char>(line[pos])) != 0) {
            ++pos;
        }
        auto start = pos;
        while (pos < line.size() &&
               std::isspace(static_cast<unsigned char>(line[pos])) == 0) {
            ++pos;
        }
        if (pos > start) {
            fields.push_back(line.substr(start, pos - start));
        }
    }
    return fields;
}

template <typename T>
auto toNumber(std::string_view text) -> std::optional<T> {
    text = trim(text);
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto stripPercent(std::string_view text) -> std::string_view {
    text = trim(text);
    if (!text.empty() && text.back() == '%') {
        text.remove_suffix(1);
    }
    return text;
}

auto isMountOfInterest(std::string_view mount) -> bool {
    return mount == "/" || mount == "/home" || mount.starts_with("/mnt") ||
           mount.starts_with("/media") || mount.starts_with("/srv");
}

// "/dev/sda1" -> "sda"
auto baseDeviceName(std::string_view source) -> std::string {
    if (auto slash = source.rfind('/'); slash != std::string_view::npos) {
        source.remove_prefix(slash + 1);
    }
    while (!source.empty() &&
           std::isdigit(static_cast<unsigned char>(source.back())) != 0) {
        source.remove_suffix(1);
    }
    return std::string(source);
}

auto splitSections(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> sections;
    std::size_t start = 0;
    while (true) {
        auto end = text.find(kSectionSeparator, start);
        if (end == std::string_view::npos) {
            sections.push_back(text.substr(start));
            break;
        }
        sections.push_back(text.substr(start, end - start));
        start = end + kSectionSeparator.size();
    }
    return sections;
}

}  // namespace

auto remoteSnapshotCommand() -> std::string {
    return "nproc; echo '---'; cat /proc/loadavg; echo '---'; "
           "cat /proc/meminfo | head -10; echo '---'; "
           "cat /sys/class/thermal/thermal_zone*/temp 2>/dev/null | head -1; "
           "echo '---'; cat /proc/uptime";
}

auto parseCpuPercent(std::string_view loadavg, int cpuCount)
    -> std::optional<double> {
    auto fields = splitFields(loadavg);
    if (fields.empty()) {
        return std::nullopt;
    }
    auto load = toNumber<double>(fields.front());
    if (!load) {
        return std::nullopt;
    }
    cpuCount = std::max(1, cpuCount);
    auto percent = static_cast<int>(*load / cpuCount * 100.0);
    return static_cast<double>(std::min(100, percent));
}

auto parseMemInfo(std::string_view meminfo, device::DeviceStats& stats)
    -> bool {
    std::map<std::string, std::uint64_t, std::less<>> values;
    for (auto line : splitLines(meminfo)) {
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        auto fields = splitFields(line.substr(colon + 1));
        if (fields.empty()) {
            continue;
        }
        if (auto kib = toNumber<std::uint64_t>(fields.front())) {
            values[std::string(trim(line.substr(0, colon)))] = *kib * 1024;
        }
    }

    auto total = values.find("MemTotal");
    if (total == values.end()) {
        return false;
    }
    stats.ramTotal = total->second;

    std::uint64_t available = 0;
    if (auto it = values.find("MemAvailable"); it != values.end()) {
        available = it->second;
    } else {
        for (const char* key : {"MemFree", "Buffers", "Cached"}) {
            if (auto it = values.find(key); it != values.end()) {
                available += it->second;
            }
        }
    }
    stats.ramUsed = stats.ramTotal > available ? stats.ramTotal - available : 0;
    return true;
}

auto parseThermal(std::string_view text) -> std::optional<double> {
    auto milli = toNumber<long>(text);
    if (!milli) {
        return std::nullopt;
    }
    return static_cast<double>(*milli / 1000);
}

auto parseUptime(std::string_view text) -> std::optional<std::string> {
    auto fields = splitFields(text);
    if (fields.empty()) {
        return std::nullopt;
    }
    auto seconds = toNumber<double>(fields.front());
    if (!seconds || *seconds < 0) {
        return std::nullopt;
    }
    auto whole = static_cast<long long>(*seconds);
    auto days = whole / 86400;
    auto hours = (whole % 86400) / 3600;
    if (days > 0) {
        return std::to_string(days) + "d " + std::to_string(hours) + "h";
    }
    return std::to_string(hours) + "h";
}

auto parseDiskUsage(std::string_view dfOutput)
    -> std::vector<device::DiskUsage> {
    std::vector<device::DiskUsage> disks;
    auto lines = splitLines(dfOutput);
    // First line is the header.
    for (std::size_t i = 1; i < lines.size(); ++i) {
        auto fields = splitFields(lines[i]);
        if (fields.size() < 4 || !isMountOfInterest(fields[1])) {
            continue;
        }
        auto size = toNumber<std::uint64_t>(fields[2]);
        auto used = toNumber<std::uint64_t>(fields[3]);
        if (!size || !used || *size <= kMinDiskSize) {
            continue;
        }
        disks.push_back(device::DiskUsage{std::string(fields[1]),
                                          baseDeviceName(fields[0]), *size,
                                          *used});
    }
    return disks;
}

auto parseBlockDisks(std::string_view lsblkOutput) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (auto line : splitLines(lsblkOutput)) {
        auto fields = splitFields(line);
        if (fields.size() >= 2 && fields[1] == "disk") {
            names.emplace_back(fields[0]);
        }
    }
    return names;
}

auto parseSmartOutput(std::string_view smartctlOutput) -> device::DiskHealth {
    device::DiskHealth health;
    if (smartctlOutput.find("PASSED") != std::string_view::npos) {
        health.smart = device::SmartState::Ok;
    } else if (smartctlOutput.find("FAILED") != std::string_view::npos) {
        health.smart = device::SmartState::Failed;
    }

    // Attribute rows look like
    // "194 Temperature_Celsius 0x0022 ... Always - 34 (Min/Max 20/45)".
    for (auto line : splitLines(smartctlOutput)) {
        if (line.find("Temperature") == std::string_view::npos) {
            continue;
        }
        auto dash = line.rfind('-');
        if (dash == std::string_view::npos) {
            continue;
        }
        auto fields = splitFields(line.substr(dash + 1));
        if (fields.empty()) {
            continue;
        }
        if (auto value = toNumber<int>(fields.front());
            value && *value > 0 && *value < 100) {
            health.temperature = *value;
            break;
        }
    }
    return health;
}

auto parseContainerStats(std::string_view output)
    -> std::map<std::string, device::ContainerStats> {
    std::map<std::string, device::ContainerStats> result;
    for (auto line : splitLines(output)) {
        auto first = line.find(':');
        if (first == std::string_view::npos) {
            continue;
        }
        auto second = line.find(':', first + 1);
        if (second == std::string_view::npos) {
            continue;
        }
        auto third = line.find(':', second + 1);
        auto cpu = toNumber<double>(
            stripPercent(line.substr(first + 1, second - first - 1)));
        auto mem = toNumber<double>(stripPercent(
            line.substr(second + 1, third == std::string_view::npos
                                        ? std::string_view::npos
                                        : third - second - 1)));
        if (cpu && mem) {
            result[std::string(line.substr(0, first))] =
                device::ContainerStats{*cpu, *mem};
        }
    }
    return result;
}

auto parseContainerStates(std::string_view output,
                          const std::vector<std::string>& configured)
    -> std::map<std::string, std::string> {
    std::map<std::string, std::string, std::less<>> listed;
    for (auto line : splitLines(output)) {
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        std::string state(trim(line.substr(colon + 1)));
        std::transform(state.begin(), state.end(), state.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        listed[std::string(line.substr(0, colon))] = std::move(state);
    }

    std::map<std::string, std::string> states;
    for (const auto& name : configured) {
        auto it = listed.find(name);
        states[name] = it != listed.end()
                           ? it->second
                           : std::string(device::kContainerUnknown);
    }
    return states;
}

auto parseRemoteSnapshot(std::string_view output)
    -> std::optional<device::DeviceStats> {
    auto sections = splitSections(output);
    if (sections.size() < 5) {
        return std::nullopt;
    }

    device::DeviceStats stats;
    int cpuCount = toNumber<int>(sections[0]).value_or(4);
    auto cpu = parseCpuPercent(sections[1], cpuCount);
    if (!cpu) {
        return std::nullopt;
    }
    stats.cpu = *cpu;
    parseMemInfo(sections[2], stats);
    stats.temperature = parseThermal(sections[3]);
    auto uptime = parseUptime(sections[4]);
    if (!uptime) {
        return std::nullopt;
    }
    stats.uptime = *uptime;
    return stats;
}

auto unknownStates(const std::vector<std::string>& configured)
    -> std::map<std::string, std::string> {
    std::map<std::string, std::string> states;
    for (const auto& name : configured) {
        states[name] = std::string(device::kContainerUnknown);
    }
    return states;
}

}  // namespace deq::command::stats
