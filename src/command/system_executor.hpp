/*
 * system_executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-13

Description: ICommandExecutor backed by ping, ssh, docker, rsync and the
local /proc filesystem

**************************************************/

#ifndef DEQ_COMMAND_SYSTEM_EXECUTOR_HPP
#define DEQ_COMMAND_SYSTEM_EXECUTOR_HPP

#include <filesystem>

#include "command_executor.hpp"
#include "shell.hpp"

namespace deq::command {

class SystemCommandExecutor : public ICommandExecutor {
public:
    /**
     * @param stagingRoot Parent directory for remote to remote staging
     */
    explicit SystemCommandExecutor(std::filesystem::path stagingRoot);

    auto probe(const device::Device& device) -> bool override;

    auto fetchStats(const device::Device& device)
        -> std::optional<device::DeviceStats> override;

    auto fetchContainerStates(const device::Device& device)
        -> std::map<std::string, std::string> override;

    auto runAction(const device::Device& device, const std::string& container,
                   ContainerAction action) -> CommandResult override;

    auto sync(const device::Device& source, const std::string& sourcePath,
              const device::Device& destination,
              const std::string& destinationPath,
              const SyncOptions& options) -> SyncResult override;

    auto wakeOnLan(const std::string& mac, const std::string& broadcast)
        -> CommandResult override;

    auto shutdown(const device::Device& device) -> CommandResult override;

private:
    auto localStats() -> device::DeviceStats;
    auto remoteStats(const device::Device& device)
        -> std::optional<device::DeviceStats>;

    /**
     * @brief Runs a docker command on a remote device, retrying once with
     * sudo when the daemon socket is not accessible.
     */
    auto runRemoteDocker(const device::Device& device,
                         const std::string& dockerArgs,
                         std::chrono::seconds timeout) -> ProcessResult;

    std::filesystem::path stagingRoot_;
};

}  // namespace deq::command

#endif  // DEQ_COMMAND_SYSTEM_EXECUTOR_HPP
