/*
 * shell.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "shell.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>

#include <spdlog/spdlog.h>

#include "atom/system/command.hpp"

namespace deq::command {

namespace {

// Exit status used by coreutils timeout(1) when the limit was hit, and the
// status after the follow-up SIGKILL.
constexpr int kTimeoutExit = 124;
constexpr int kTimeoutKilledExit = 137;
constexpr int kKillGraceSeconds = 5;

auto normalizeExitStatus(int raw) -> int {
    // The runner may hand back the raw wait status from pclose().
    if (raw > 255) {
        return WEXITSTATUS(raw);
    }
    return raw;
}

auto isAllDigits(std::string_view text) -> bool {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

auto shellQuote(std::string_view arg) -> std::string {
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('\'');
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

auto joinArgs(const std::vector<std::string>& args) -> std::string {
    std::string line;
    for (const auto& arg : args) {
        if (!line.empty()) {
            line.push_back(' ');
        }
        line += shellQuote(arg);
    }
    return line;
}

auto runProcess(const std::vector<std::string>& args,
                std::chrono::seconds timeout) -> ProcessResult {
    ProcessResult result;
    if (args.empty()) {
        result.output = "empty command";
        return result;
    }

    std::vector<std::string> wrapped{"timeout", "-k",
                                     std::to_string(kKillGraceSeconds),
                                     std::to_string(timeout.count())};
    wrapped.insert(wrapped.end(), args.begin(), args.end());
    const auto commandLine = joinArgs(wrapped) + " 2>&1";

    spdlog::trace("Executing: {}", commandLine);
    try {
        auto [output, status] =
            atom::system::executeCommandWithStatus(commandLine);
        result.output = std::move(output);
        result.exitCode = normalizeExitStatus(status);
    } catch (const std::exception& e) {
        spdlog::error("Failed to execute '{}': {}", args.front(), e.what());
        result.output = e.what();
        result.exitCode = -1;
        return result;
    }

    if (result.exitCode == kTimeoutExit ||
        result.exitCode == kTimeoutKilledExit) {
        result.timedOut = true;
        spdlog::warn("Command '{}' timed out after {}s", args.front(),
                     timeout.count());
    }
    return result;
}

auto sshBaseArgs(const device::Device& device, int connectTimeout,
                 bool batchMode) -> std::vector<std::string> {
    const auto& ssh = device.ssh.value_or(device::SshConfig{});
    std::vector<std::string> args{
        "ssh", "-o", "StrictHostKeyChecking=no", "-o",
        "ConnectTimeout=" + std::to_string(connectTimeout)};
    if (batchMode) {
        args.emplace_back("-o");
        args.emplace_back("BatchMode=yes");
    }
    args.emplace_back("-p");
    args.emplace_back(std::to_string(ssh.port));
    args.emplace_back(ssh.user + "@" + device.ip);
    return args;
}

auto runRemote(const device::Device& device, const std::string& remoteCommand,
               std::chrono::seconds timeout, int connectTimeout)
    -> ProcessResult {
    if (auto problem = validateSshTarget(device); !problem.empty()) {
        return ProcessResult{-1, std::move(problem), false};
    }
    auto args = sshBaseArgs(device, connectTimeout);
    args.push_back(remoteCommand);
    return runProcess(args, timeout);
}

auto isValidIpAddress(std::string_view ip) -> bool {
    if (ip.empty() || ip.size() > 253) {
        return false;
    }
    if (ip == "localhost") {
        return true;
    }

    int parts = 0;
    bool numeric = true;
    std::size_t start = 0;
    while (start <= ip.size()) {
        auto end = ip.find('.', start);
        if (end == std::string_view::npos) {
            end = ip.size();
        }
        auto part = ip.substr(start, end - start);
        if (!isAllDigits(part) || part.size() > 3) {
            numeric = false;
            break;
        }
        int value = 0;
        std::from_chars(part.data(), part.data() + part.size(), value);
        if (value > 255) {
            return false;
        }
        ++parts;
        start = end + 1;
    }
    if (numeric) {
        return parts == 4;
    }

    // DNS host name. A leading '-' would be read as an ssh/ping option.
    static const std::regex kHostname(
        R"(^[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?(\.[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?)*$)");
    return std::regex_match(ip.begin(), ip.end(), kHostname) &&
           !isAllDigits(ip.substr(ip.rfind('.') + 1));
}

auto isValidMacAddress(std::string_view mac) -> bool {
    std::size_t hexDigits = 0;
    for (char c : mac) {
        if (c == ':' || c == '-') {
            continue;
        }
        if (std::isxdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
        ++hexDigits;
    }
    return hexDigits == 12;
}

auto isValidPort(int port) -> bool { return port >= 1 && port <= 65535; }

auto isValidSshUser(std::string_view user) -> bool {
    if (user.empty() || user.size() > 32) {
        return false;
    }
    static const std::regex kUser(R"(^[a-z_][a-z0-9_-]*$)",
                                  std::regex::icase);
    return std::regex_match(user.begin(), user.end(), kUser);
}

auto isValidContainerName(std::string_view name) -> bool {
    if (name.empty() || name.size() > 128) {
        return false;
    }
    static const std::regex kName(R"(^[a-zA-Z0-9][a-zA-Z0-9_.-]*$)");
    return std::regex_match(name.begin(), name.end(), kName);
}

auto isValidRemotePath(std::string_view path) -> bool {
    return !path.empty() && path.front() == '/' &&
           path.find('\0') == std::string_view::npos &&
           path.find('\n') == std::string_view::npos;
}

auto validateSshTarget(const device::Device& device) -> std::string {
    if (!device.hasSshCredentials()) {
        return "SSH not configured";
    }
    if (!isValidSshUser(device.ssh->user)) {
        return "Invalid SSH user";
    }
    if (!isValidPort(device.ssh->port)) {
        return "Invalid SSH port";
    }
    if (!isValidIpAddress(device.ip)) {
        return "Invalid IP address";
    }
    return {};
}

}  // namespace deq::command
