/*
 * test_device_types.cpp - Tests for device records and status serialization
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "device/device_types.hpp"

using namespace deq::device;

// ========== Device Parsing Tests ==========

TEST(DeviceTypesTest, ParsesFullRemoteDevice) {
    auto device = json::parse(R"({
        "id": "nas", "name": "Synology", "ip": "10.0.0.2",
        "ssh": {"user": "admin", "port": 2222},
        "wol": {"mac": "AA:BB:CC:DD:EE:FF"},
        "docker": {"containers": ["plex", {"name": "db"}, 7]},
        "alerts": {"cpu": 70, "online": false}
    })").get<Device>();

    EXPECT_EQ(device.id, "nas");
    EXPECT_FALSE(device.isHost);
    ASSERT_TRUE(device.hasSshCredentials());
    EXPECT_EQ(device.ssh->port, 2222);
    ASSERT_TRUE(device.wol.has_value());
    EXPECT_EQ(device.wol->broadcast, "255.255.255.255");
    EXPECT_EQ(device.containers, (std::vector<std::string>{"plex", "db"}));

    auto alerts = device.effectiveAlerts();
    EXPECT_DOUBLE_EQ(alerts.cpu, 70.0);
    EXPECT_DOUBLE_EQ(alerts.ram, 90.0);
    EXPECT_FALSE(alerts.online);
}

TEST(DeviceTypesTest, MinimalDeviceUsesDefaults) {
    auto device = json::parse(R"({"id": "pi"})").get<Device>();
    EXPECT_EQ(device.displayName(), "pi");
    EXPECT_FALSE(device.hasSshCredentials());
    EXPECT_FALSE(device.wol.has_value());
    EXPECT_DOUBLE_EQ(device.effectiveAlerts().cpuTemp, 80.0);
}

TEST(DeviceTypesTest, SshWithoutUserIsNotUsable) {
    auto device =
        json::parse(R"({"id": "pi", "ssh": {"port": 22}})").get<Device>();
    EXPECT_TRUE(device.ssh.has_value());
    EXPECT_FALSE(device.hasSshCredentials());
}

TEST(DeviceTypesTest, MissingIdThrows) {
    EXPECT_THROW(json::parse(R"({"name": "x"})").get<Device>(),
                 json::exception);
}

// ========== Stats Tests ==========

TEST(DeviceTypesTest, RamAndDiskPercent) {
    DeviceStats stats;
    EXPECT_FALSE(stats.ramPercent().has_value());
    EXPECT_FALSE(stats.maxDiskPercent().has_value());

    stats.ramUsed = 1;
    stats.ramTotal = 4;
    stats.disks.push_back(DiskUsage{"/", "/dev/sda1", 200, 50});
    stats.disks.push_back(DiskUsage{"/mnt", "/dev/sdb1", 0, 0});
    EXPECT_DOUBLE_EQ(*stats.ramPercent(), 25.0);
    EXPECT_DOUBLE_EQ(*stats.maxDiskPercent(), 25.0);
}

TEST(DeviceTypesTest, SmartStateText) {
    EXPECT_EQ(smartStateFromString("ok"), SmartState::Ok);
    EXPECT_EQ(smartStateFromString("failed"), SmartState::Failed);
    EXPECT_EQ(smartStateFromString("PASSED"), SmartState::Unknown);
    EXPECT_EQ(smartStateToString(SmartState::Failed), "failed");
}

// ========== Status Serialization Tests ==========

TEST(DeviceTypesTest, UnknownStatusSerializesNulls) {
    json j = DeviceStatus{};
    EXPECT_TRUE(j["online"].is_null());
    EXPECT_TRUE(j["stats"].is_null());
    EXPECT_TRUE(j["containers"].empty());
}

TEST(DeviceTypesTest, OnlineStatusCarriesStats) {
    DeviceStatus status;
    status.online = OnlineState::Online;
    status.containers = {{"plex", "running"}};
    DeviceStats stats;
    stats.cpu = 12.5;
    stats.diskHealth["sda"] = DiskHealth{35, SmartState::Ok};
    status.stats = stats;

    json j = status;
    EXPECT_TRUE(j["online"].get<bool>());
    EXPECT_DOUBLE_EQ(j["stats"]["cpu"].get<double>(), 12.5);
    EXPECT_TRUE(j["stats"]["temp"].is_null());
    EXPECT_EQ(j["stats"]["disk_smart"]["sda"]["smart"], "ok");
    EXPECT_EQ(j["stats"]["disk_smart"]["sda"]["temp"], 35);
    EXPECT_EQ(j["containers"]["plex"], "running");
}

TEST(DeviceTypesTest, DeviceWritesDockerSectionOnlyWithContainers) {
    Device device;
    device.id = "pi";
    EXPECT_FALSE(json(device).contains("docker"));

    device.containers = {"pihole"};
    auto j = json(device);
    EXPECT_EQ(j["docker"]["containers"][0], "pihole");
    EXPECT_EQ(j["name"], "pi");
}
