/*
 * rsync.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-13

Description: rsync command construction, staging for remote to remote
transfers and parsing of the --stats summary

**************************************************/

#ifndef DEQ_COMMAND_RSYNC_HPP
#define DEQ_COMMAND_RSYNC_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "device/device_types.hpp"

namespace deq::command::rsync {

/**
 * @brief "user@ip:path" for remote devices, the plain path for the host.
 *
 * A remote device without an SSH user is addressed as root.
 */
auto endpointSpec(const device::Device& device, const std::string& path)
    -> std::string;

/**
 * @brief `rsync -avz --stats [--delete] [-e ssh...] SRC DST`
 *
 * @param sshPort Port of the remote side, when one side is remote
 */
auto buildCommand(const std::string& source, const std::string& destination,
                  std::optional<int> sshPort, bool deleteExtraneous)
    -> std::vector<std::string>;

/**
 * @brief The rsync invocations needed to copy between two devices.
 *
 * Host to host, host to remote and remote to host use one direct leg.
 * Remote to remote pulls into @p stagingDir first and pushes from there,
 * keeping the trailing-slash semantics of @p sourcePath.
 */
struct SyncPlan {
    std::vector<std::vector<std::string>> legs;
    bool staged{false};
    /// Directory on this machine that has to exist before the first leg
    std::optional<std::filesystem::path> localDestination;
};

auto planSync(const device::Device& source, const std::string& sourcePath,
              const device::Device& destination,
              const std::string& destinationPath, bool deleteExtraneous,
              const std::filesystem::path& stagingDir) -> SyncPlan;

/**
 * @brief "1.2GB", "15MB" or "900KB" from a byte count.
 */
auto formatSize(std::uint64_t bytes) -> std::string;

/**
 * @brief Formatted "Total file size" from `rsync --stats` output, or an
 * empty string when the line is missing.
 */
auto parseTransferSize(std::string_view output) -> std::string;

/**
 * @brief Uniquely named scratch directory removed on destruction.
 */
class StagingArea {
public:
    explicit StagingArea(const std::filesystem::path& root);
    ~StagingArea();

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

    /**
     * @brief Whether the directory could be created.
     */
    [[nodiscard]] auto ready() const -> bool { return ready_; }

private:
    std::filesystem::path path_;
    bool ready_{false};
};

}  // namespace deq::command::rsync

#endif  // DEQ_COMMAND_RSYNC_HPP
