/*
 * test_shell.cpp - Tests for process helpers and input validation
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <algorithm>

#include "command/shell.hpp"

using namespace deq::command;
using deq::device::Device;
using deq::device::SshConfig;

// ========== Quoting Tests ==========

TEST(ShellQuoteTest, WrapsInSingleQuotes) {
    EXPECT_EQ(shellQuote("plain"), "'plain'");
    EXPECT_EQ(shellQuote(""), "''");
    EXPECT_EQ(shellQuote("a b;rm -rf /"), "'a b;rm -rf /'");
}

TEST(ShellQuoteTest, EscapesEmbeddedQuotes) {
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
}

TEST(ShellQuoteTest, JoinArgsQuotesEachElement) {
    EXPECT_EQ(joinArgs({"docker", "start", "web app"}),
              "'docker' 'start' 'web app'");
    EXPECT_EQ(joinArgs({}), "");
}

// ========== Validation Tests ==========

TEST(ValidationTest, IpAddresses) {
    EXPECT_TRUE(isValidIpAddress("192.168.1.10"));
    EXPECT_TRUE(isValidIpAddress("0.0.0.0"));
    EXPECT_TRUE(isValidIpAddress("localhost"));
    EXPECT_TRUE(isValidIpAddress("nas.local"));
    EXPECT_TRUE(isValidIpAddress("pi-4"));

    EXPECT_FALSE(isValidIpAddress(""));
    EXPECT_FALSE(isValidIpAddress("256.1.1.1"));
    EXPECT_FALSE(isValidIpAddress("1.2.3"));
    EXPECT_FALSE(isValidIpAddress("1.2.3.4.5"));
    EXPECT_FALSE(isValidIpAddress("-oProxyCommand=x"));
    EXPECT_FALSE(isValidIpAddress("host;reboot"));
    EXPECT_FALSE(isValidIpAddress("a b"));
}

TEST(ValidationTest, MacAddresses) {
    EXPECT_TRUE(isValidMacAddress("AA:BB:CC:DD:EE:FF"));
    EXPECT_TRUE(isValidMacAddress("aa-bb-cc-dd-ee-ff"));
    EXPECT_TRUE(isValidMacAddress("aabbccddeeff"));

    EXPECT_FALSE(isValidMacAddress("AA:BB:CC:DD:EE"));
    EXPECT_FALSE(isValidMacAddress("GG:BB:CC:DD:EE:FF"));
    EXPECT_FALSE(isValidMacAddress(""));
}

TEST(ValidationTest, Ports) {
    EXPECT_TRUE(isValidPort(22));
    EXPECT_TRUE(isValidPort(65535));
    EXPECT_FALSE(isValidPort(0));
    EXPECT_FALSE(isValidPort(65536));
    EXPECT_FALSE(isValidPort(-22));
}

TEST(ValidationTest, SshUsers) {
    EXPECT_TRUE(isValidSshUser("root"));
    EXPECT_TRUE(isValidSshUser("_svc-backup2"));
    EXPECT_FALSE(isValidSshUser(""));
    EXPECT_FALSE(isValidSshUser("2admin"));
    EXPECT_FALSE(isValidSshUser("admin;id"));
    EXPECT_FALSE(isValidSshUser(std::string(33, 'a')));
}

TEST(ValidationTest, ContainerNames) {
    EXPECT_TRUE(isValidContainerName("nextcloud"));
    EXPECT_TRUE(isValidContainerName("my_app.v2-1"));
    EXPECT_FALSE(isValidContainerName(""));
    EXPECT_FALSE(isValidContainerName("-rm"));
    EXPECT_FALSE(isValidContainerName("a b"));
    EXPECT_FALSE(isValidContainerName(std::string(129, 'a')));
}

TEST(ValidationTest, RemotePaths) {
    EXPECT_TRUE(isValidRemotePath("/srv/data/"));
    EXPECT_FALSE(isValidRemotePath("relative/path"));
    EXPECT_FALSE(isValidRemotePath(""));
    EXPECT_FALSE(isValidRemotePath("/tmp/a\nb"));
}

TEST(ValidationTest, SshTargetReasons) {
    Device device;
    device.ip = "10.0.0.5";
    EXPECT_EQ(validateSshTarget(device), "SSH not configured");

    device.ssh = SshConfig{"bad user", 22};
    EXPECT_EQ(validateSshTarget(device), "Invalid SSH user");

    device.ssh = SshConfig{"admin", 0};
    EXPECT_EQ(validateSshTarget(device), "Invalid SSH port");

    device.ssh = SshConfig{"admin", 22};
    device.ip = "10.0.0.300";
    EXPECT_EQ(validateSshTarget(device), "Invalid IP address");

    device.ip = "10.0.0.5";
    EXPECT_EQ(validateSshTarget(device), "");
}

// ========== SSH Argument Tests ==========

TEST(SshArgsTest, IncludesPortUserAndOptions) {
    Device device;
    device.ip = "10.0.0.5";
    device.ssh = SshConfig{"admin", 2222};

    auto args = sshBaseArgs(device, 3);
    ASSERT_FALSE(args.empty());
    EXPECT_EQ(args.front(), "ssh");
    EXPECT_EQ(args.back(), "admin@10.0.0.5");
    EXPECT_NE(std::find(args.begin(), args.end(), "ConnectTimeout=3"),
              args.end());
    EXPECT_NE(std::find(args.begin(), args.end(), "BatchMode=yes"),
              args.end());
    auto port = std::find(args.begin(), args.end(), "-p");
    ASSERT_NE(port, args.end());
    EXPECT_EQ(*(port + 1), "2222");
}

TEST(SshArgsTest, RunRemoteRejectsInvalidTargetWithoutSpawning) {
    Device device;
    device.ip = "10.0.0.5";
    device.ssh = SshConfig{"admin;reboot", 22};

    auto result = runRemote(device, "uptime", std::chrono::seconds(1));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.output, "Invalid SSH user");
}

TEST(ProcessTest, EmptyCommandFails) {
    auto result = runProcess({}, std::chrono::seconds(1));
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.timedOut);
}
