/*
 * shell.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-11

Description: Process execution with timeouts, argument quoting and input
validation for everything that ends up on a command line

**************************************************/

#ifndef DEQ_COMMAND_SHELL_HPP
#define DEQ_COMMAND_SHELL_HPP

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "device/device_types.hpp"

namespace deq::command {

/**
 * @brief Combined stdout/stderr and exit status of a finished process.
 */
struct ProcessResult {
    int exitCode{-1};
    std::string output;
    bool timedOut{false};

    [[nodiscard]] auto ok() const -> bool { return exitCode == 0 && !timedOut; }
};

/**
 * @brief Wraps @p arg in single quotes, escaping embedded quotes.
 */
auto shellQuote(std::string_view arg) -> std::string;

/**
 * @brief Quotes every element and joins them with spaces.
 */
auto joinArgs(const std::vector<std::string>& args) -> std::string;

/**
 * @brief Runs a command line and waits at most @p timeout for it.
 *
 * The process is started through `timeout(1)`, so a hung child is killed and
 * reported with timedOut=true. Never throws.
 *
 * @param args Program followed by its arguments, quoted before execution
 * @param timeout Hard limit on the run time
 */
auto runProcess(const std::vector<std::string>& args,
                std::chrono::seconds timeout) -> ProcessResult;

/**
 * @brief `ssh` invocation prefix for @p device.
 *
 * @param connectTimeout Seconds passed as ConnectTimeout
 * @param batchMode Adds BatchMode=yes so no password prompt can block
 */
auto sshBaseArgs(const device::Device& device, int connectTimeout = 5,
                 bool batchMode = true) -> std::vector<std::string>;

/**
 * @brief Runs @p remoteCommand on @p device through ssh.
 *
 * The caller is responsible for quoting inside @p remoteCommand.
 */
auto runRemote(const device::Device& device, const std::string& remoteCommand,
               std::chrono::seconds timeout, int connectTimeout = 5)
    -> ProcessResult;

auto isValidIpAddress(std::string_view ip) -> bool;
auto isValidMacAddress(std::string_view mac) -> bool;
auto isValidPort(int port) -> bool;
auto isValidSshUser(std::string_view user) -> bool;
auto isValidContainerName(std::string_view name) -> bool;

/**
 * @brief Absolute path without NUL bytes or newlines.
 */
auto isValidRemotePath(std::string_view path) -> bool;

/**
 * @brief Validates the ssh fields of @p device.
 * @return Empty string when usable, otherwise the reason
 */
auto validateSshTarget(const device::Device& device) -> std::string;

}  // namespace deq::command

#endif  // DEQ_COMMAND_SHELL_HPP
