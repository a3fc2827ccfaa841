/*
 * rsync.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "rsync.hpp"

#include <format>
#include <system_error>

#include <spdlog/spdlog.h>

#include "atom/utils/uuid.hpp"

namespace deq::command::rsync {

namespace {

auto sshPortOf(const device::Device& device) -> int {
    return device.ssh ? device.ssh->port : 22;
}

auto hasTrailingSlash(const std::string& path) -> bool {
    return !path.empty() && path.back() == '/';
}

}  // namespace

auto endpointSpec(const device::Device& device, const std::string& path)
    -> std::string {
    if (device.isHost) {
        return path;
    }
    std::string user = device.hasSshCredentials() ? device.ssh->user : "root";
    return user + "@" + device.ip + ":" + path;
}

auto buildCommand(const std::string& source, const std::string& destination,
                  std::optional<int> sshPort, bool deleteExtraneous)
    -> std::vector<std::string> {
    std::vector<std::string> args{"rsync", "-avz", "--stats"};
    if (deleteExtraneous) {
        args.emplace_back("--delete");
    }
    if (sshPort) {
        args.emplace_back("-e");
        args.push_back(std::format(
            "ssh -p {} -o StrictHostKeyChecking=no -o ConnectTimeout=10",
            *sshPort));
    }
    args.push_back(source);
    args.push_back(destination);
    return args;
}

auto planSync(const device::Device& source, const std::string& sourcePath,
              const device::Device& destination,
              const std::string& destinationPath, bool deleteExtraneous,
              const std::filesystem::path& stagingDir) -> SyncPlan {
    SyncPlan plan;

    if (source.isHost || destination.isHost) {
        std::optional<int> port;
        if (!source.isHost) {
            port = sshPortOf(source);
        } else if (!destination.isHost) {
            port = sshPortOf(destination);
        }
        if (destination.isHost) {
            plan.localDestination = destinationPath;
        }
        plan.legs.push_back(buildCommand(endpointSpec(source, sourcePath),
                                         endpointSpec(destination,
                                                      destinationPath),
                                         port, deleteExtraneous));
        return plan;
    }

    // Remote to remote: pull into the staging directory, then push the
    // same entry onwards so the result matches a direct transfer.
    plan.staged = true;
    plan.localDestination = stagingDir;
    const auto stagingSpec = stagingDir.string() + "/";
    plan.legs.push_back(buildCommand(endpointSpec(source, sourcePath),
                                     stagingSpec, sshPortOf(source),
                                     deleteExtraneous));

    std::string pushSource = stagingSpec;
    if (!hasTrailingSlash(sourcePath)) {
        pushSource = (stagingDir /
                      std::filesystem::path(sourcePath).filename())
                         .string();
    }
    plan.legs.push_back(buildCommand(pushSource,
                                     endpointSpec(destination, destinationPath),
                                     sshPortOf(destination),
                                     deleteExtraneous));
    return plan;
}

auto formatSize(std::uint64_t bytes) -> std::string {
    const auto value = static_cast<double>(bytes);
    if (value >= 1e9) {
        return std::format("{:.1f}GB", value / 1e9);
    }
    if (value >= 1e6) {
        return std::format("{:.0f}MB", value / 1e6);
    }
    return std::format("{:.0f}KB", value / 1e3);
}

auto parseTransferSize(std::string_view output) -> std::string {
    std::size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\n', start);
        if (end == std::string_view::npos) {
            end = output.size();
        }
        auto line = output.substr(start, end - start);
        start = end + 1;

        if (line.find("Total file size") == std::string_view::npos ||
            line.find("transferred") != std::string_view::npos) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }

        // "Total file size: 1,234,567 bytes"; digit grouping varies by locale.
        std::uint64_t bytes = 0;
        bool sawDigit = false;
        for (char c : line.substr(colon + 1)) {
            if (c >= '0' && c <= '9') {
                bytes = bytes * 10 + static_cast<std::uint64_t>(c - '0');
                sawDigit = true;
            } else if (c == ',' || c == '.') {
                continue;
            } else if (sawDigit) {
                break;
            }
        }
        if (sawDigit) {
            return formatSize(bytes);
        }
    }
    return {};
}

StagingArea::StagingArea(const std::filesystem::path& root)
    : path_(root / ("deq-staging-" + atom::utils::UUID().toString())) {
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
        spdlog::error("Failed to create staging directory {}: {}",
                      path_.string(), ec.message());
        return;
    }
    ready_ = true;
    spdlog::debug("Created staging directory {}", path_.string());
}

StagingArea::~StagingArea() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging directory {}: {}",
                     path_.string(), ec.message());
    }
}

}  // namespace deq::command::rsync
