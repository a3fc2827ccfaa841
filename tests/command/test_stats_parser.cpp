/*
 * test_stats_parser.cpp - Tests for /proc, df, smartctl and docker parsers
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "command/stats_parser.hpp"

using namespace deq::command::stats;
using deq::device::DeviceStats;
using deq::device::SmartState;

// ========== CPU / Memory / Thermal Tests ==========

TEST(StatsParserTest, CpuPercentFromLoadAverage) {
    EXPECT_EQ(parseCpuPercent("1.00 0.50 0.25 1/200 1234", 4), 25.0);
    EXPECT_EQ(parseCpuPercent("0.99 0.50 0.25 1/200 1234", 1), 99.0);
}

TEST(StatsParserTest, CpuPercentIsCapped) {
    EXPECT_EQ(parseCpuPercent("12.5 3.0 2.0 1/200 1234", 4), 100.0);
}

TEST(StatsParserTest, CpuPercentRejectsGarbage) {
    EXPECT_FALSE(parseCpuPercent("", 4).has_value());
    EXPECT_FALSE(parseCpuPercent("abc", 4).has_value());
}

TEST(StatsParserTest, MemInfoPrefersMemAvailable) {
    DeviceStats stats;
    ASSERT_TRUE(parseMemInfo("MemTotal:       1000 kB\n"
                             "MemFree:         100 kB\n"
                             "MemAvailable:    400 kB\n"
                             "Buffers:          50 kB\n"
                             "Cached:          200 kB\n",
                             stats));
    EXPECT_EQ(stats.ramTotal, 1000u * 1024);
    EXPECT_EQ(stats.ramUsed, 600u * 1024);
}

TEST(StatsParserTest, MemInfoFallsBackToFreeBuffersCached) {
    DeviceStats stats;
    ASSERT_TRUE(parseMemInfo("MemTotal: 1000 kB\n"
                             "MemFree: 100 kB\n"
                             "Buffers: 50 kB\n"
                             "Cached: 200 kB\n",
                             stats));
    EXPECT_EQ(stats.ramUsed, 650u * 1024);
}

TEST(StatsParserTest, MemInfoWithoutTotalFails) {
    DeviceStats stats;
    EXPECT_FALSE(parseMemInfo("MemFree: 100 kB\n", stats));
}

TEST(StatsParserTest, ThermalIsWholeDegrees) {
    EXPECT_EQ(parseThermal("45678\n"), 45.0);
    EXPECT_FALSE(parseThermal("").has_value());
}

TEST(StatsParserTest, UptimeFormatting) {
    EXPECT_EQ(parseUptime("273600.50 1000.00"), "3d 4h");
    EXPECT_EQ(parseUptime("7200.00 100.00"), "2h");
    EXPECT_FALSE(parseUptime("x").has_value());
}

// ========== Disk Tests ==========

TEST(StatsParserTest, DiskUsageKeepsMountsOfInterest) {
    auto disks = parseDiskUsage(
        "Filesystem     Mounted on        1B-blocks         Used\n"
        "/dev/sda1      /              500000000000 250000000000\n"
        "/dev/sdb1      /mnt/media    2000000000000 100000000000\n"
        "tmpfs          /run             800000000     1000000\n"
        "/dev/sdc1      /boot          50000000000  1000000000\n"
        "/dev/sdd1      /srv/small        500000000    100000\n");

    ASSERT_EQ(disks.size(), 2u);
    EXPECT_EQ(disks[0].mount, "/");
    EXPECT_EQ(disks[0].device, "sda");
    EXPECT_DOUBLE_EQ(disks[0].percent(), 50.0);
    EXPECT_EQ(disks[1].mount, "/mnt/media");
    EXPECT_EQ(disks[1].device, "sdb");
}

TEST(StatsParserTest, BlockDisksOnlyWholeDisks) {
    auto names = parseBlockDisks("sda  disk\nsda1 part\nnvme0n1 disk\nsr0 rom\n");
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "sda");
    EXPECT_EQ(names[1], "nvme0n1");
}

TEST(StatsParserTest, SmartPassedWithTemperature) {
    auto health = parseSmartOutput(
        "SMART overall-health self-assessment test result: PASSED\n"
        "194 Temperature_Celsius     0x0022   100   100   000    Old_age   "
        "Always       -       34 (Min/Max 20/45)\n");
    EXPECT_EQ(health.smart, SmartState::Ok);
    ASSERT_TRUE(health.temperature.has_value());
    EXPECT_EQ(*health.temperature, 34);
}

TEST(StatsParserTest, SmartFailedWithoutTemperature) {
    auto health = parseSmartOutput(
        "SMART overall-health self-assessment test result: FAILED!\n");
    EXPECT_EQ(health.smart, SmartState::Failed);
    EXPECT_FALSE(health.temperature.has_value());
}

TEST(StatsParserTest, SmartUnknownOnEmptyOutput) {
    EXPECT_EQ(parseSmartOutput("").smart, SmartState::Unknown);
}

// ========== Docker Tests ==========

TEST(StatsParserTest, ContainerStats) {
    auto stats = parseContainerStats("web:1.50%:10.25%\ndb:0.00%:3.10%\nbad\n");
    ASSERT_EQ(stats.size(), 2u);
    EXPECT_DOUBLE_EQ(stats["web"].cpu, 1.5);
    EXPECT_DOUBLE_EQ(stats["web"].mem, 10.25);
    EXPECT_DOUBLE_EQ(stats["db"].mem, 3.1);
}

TEST(StatsParserTest, ContainerStatesReportsMissingAsUnknown) {
    auto states = parseContainerStates("web:Running\ndb:exited\nother:running\n",
                                       {"web", "db", "cache"});
    ASSERT_EQ(states.size(), 3u);
    EXPECT_EQ(states["web"], "running");
    EXPECT_EQ(states["db"], "exited");
    EXPECT_EQ(states["cache"], "unknown");
}

TEST(StatsParserTest, UnknownStatesForEveryContainer) {
    auto states = unknownStates({"a", "b"});
    EXPECT_EQ(states.size(), 2u);
    EXPECT_EQ(states["a"], "unknown");
}

// ========== Remote Snapshot Tests ==========

TEST(StatsParserTest, RemoteSnapshot) {
    auto stats = parseRemoteSnapshot(
        "2\n---\n1.00 0.5 0.2 1/100 99\n---\n"
        "MemTotal: 2000 kB\nMemAvailable: 500 kB\n---\n51000\n---\n"
        "90000.0 100.0\n");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->cpu, 50.0);
    EXPECT_EQ(stats->ramTotal, 2000u * 1024);
    EXPECT_EQ(stats->ramUsed, 1500u * 1024);
    EXPECT_EQ(stats->temperature, 51.0);
    EXPECT_EQ(stats->uptime, "1d 1h");
}

TEST(StatsParserTest, RemoteSnapshotWithoutThermalZone) {
    auto stats = parseRemoteSnapshot(
        "4\n---\n2.00 0.5 0.2 1/100 99\n---\nMemTotal: 2000 kB\n---\n\n---\n"
        "3600.0 100.0\n");
    ASSERT_TRUE(stats.has_value());
    EXPECT_FALSE(stats->temperature.has_value());
    EXPECT_EQ(stats->uptime, "1h");
}

TEST(StatsParserTest, RemoteSnapshotTruncated) {
    EXPECT_FALSE(parseRemoteSnapshot("4\n---\n1.0 0 0\n").has_value());
}
