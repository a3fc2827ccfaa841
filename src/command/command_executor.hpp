/*
 * command_executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-11

Description: Abstract executor for probes, stats collection, docker
actions, rsync transfers, Wake-on-LAN and shutdown

**************************************************/

#ifndef DEQ_COMMAND_COMMAND_EXECUTOR_HPP
#define DEQ_COMMAND_COMMAND_EXECUTOR_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "device/device_types.hpp"

namespace deq::command {

/**
 * @brief Outcome of a command that either succeeds or carries an error text.
 */
struct CommandResult {
    bool success{false};
    std::string error;

    static auto ok() -> CommandResult { return CommandResult{true, {}}; }
    static auto fail(std::string message) -> CommandResult {
        return CommandResult{false, std::move(message)};
    }
};

enum class ContainerAction { Start, Stop };

auto containerActionName(ContainerAction action) -> const char*;

struct SyncOptions {
    bool deleteExtraneous{false};  ///< rsync --delete
    std::chrono::seconds timeout{3600};
};

struct SyncResult {
    bool success{false};
    bool timedOut{false};
    std::string sizeSummary;  ///< e.g. "1.2GB", empty when unknown
    std::string error;
};

/**
 * @brief Everything the core needs from the outside world.
 *
 * Every call is bounded by its own timeout and reports failures through its
 * return value. Implementations must be safe to call from several threads.
 */
class ICommandExecutor {
public:
    virtual ~ICommandExecutor() = default;

    /**
     * @brief Lightweight reachability check (ICMP ping, ~1s timeout).
     */
    virtual auto probe(const device::Device& device) -> bool = 0;

    /**
     * @brief Resource snapshot. Local stats for the host, SSH for remotes.
     * @return std::nullopt when the device cannot be queried
     */
    virtual auto fetchStats(const device::Device& device)
        -> std::optional<device::DeviceStats> = 0;

    /**
     * @brief Lifecycle state of every container the device declares.
     *
     * Containers that cannot be resolved are reported as "unknown".
     */
    virtual auto fetchContainerStates(const device::Device& device)
        -> std::map<std::string, std::string> = 0;

    virtual auto runAction(const device::Device& device,
                           const std::string& container,
                           ContainerAction action) -> CommandResult = 0;

    /**
     * @brief Recursive copy from one device path to another.
     *
     * Remote to remote transfers go through a local staging directory.
     */
    virtual auto sync(const device::Device& source,
                      const std::string& sourcePath,
                      const device::Device& destination,
                      const std::string& destinationPath,
                      const SyncOptions& options) -> SyncResult = 0;

    virtual auto wakeOnLan(const std::string& mac,
                           const std::string& broadcast) -> CommandResult = 0;

    /**
     * @brief Powers the device off (local for the host, SSH otherwise).
     */
    virtual auto shutdown(const device::Device& device) -> CommandResult = 0;
};

}  // namespace deq::command

#endif  // DEQ_COMMAND_COMMAND_EXECUTOR_HPP
