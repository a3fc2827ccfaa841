/*
 * test_rsync.cpp - Tests for rsync command planning and output parsing
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "command/rsync.hpp"

using namespace deq::command::rsync;
using deq::device::Device;
using deq::device::SshConfig;

namespace fs = std::filesystem;

class RsyncPlanTest : public ::testing::Test {
protected:
    void SetUp() override {
        host_.id = "host";
        host_.isHost = true;
        host_.ip = "localhost";

        nas_.id = "nas";
        nas_.ip = "10.0.0.2";
        nas_.ssh = SshConfig{"backup", 2222};

        pi_.id = "pi";
        pi_.ip = "10.0.0.3";
        pi_.ssh = SshConfig{"pi", 22};
    }

    static auto contains(const std::vector<std::string>& args,
                         const std::string& value) -> bool {
        return std::find(args.begin(), args.end(), value) != args.end();
    }

    Device host_;
    Device nas_;
    Device pi_;
};

// ========== Endpoint Tests ==========

TEST_F(RsyncPlanTest, EndpointSpec) {
    EXPECT_EQ(endpointSpec(host_, "/data"), "/data");
    EXPECT_EQ(endpointSpec(nas_, "/volume1/"), "backup@10.0.0.2:/volume1/");

    Device anonymous;
    anonymous.ip = "10.0.0.9";
    EXPECT_EQ(endpointSpec(anonymous, "/x"), "root@10.0.0.9:/x");
}

TEST_F(RsyncPlanTest, BuildCommandOptions) {
    auto plain = buildCommand("/a/", "/b", std::nullopt, false);
    EXPECT_EQ(plain, (std::vector<std::string>{"rsync", "-avz", "--stats",
                                               "/a/", "/b"}));

    auto remote = buildCommand("/a/", "u@h:/b", 2222, true);
    EXPECT_TRUE(contains(remote, "--delete"));
    EXPECT_TRUE(contains(remote, "-e"));
    EXPECT_TRUE(contains(
        remote,
        "ssh -p 2222 -o StrictHostKeyChecking=no -o ConnectTimeout=10"));
    EXPECT_EQ(remote.back(), "u@h:/b");
}

// ========== Plan Tests ==========

TEST_F(RsyncPlanTest, HostToRemoteIsDirect) {
    auto plan = planSync(host_, "/data/", nas_, "/backup", false, "/tmp");
    EXPECT_FALSE(plan.staged);
    ASSERT_EQ(plan.legs.size(), 1u);
    EXPECT_FALSE(plan.localDestination.has_value());
    EXPECT_EQ(plan.legs[0].back(), "backup@10.0.0.2:/backup");
    EXPECT_TRUE(contains(
        plan.legs[0],
        "ssh -p 2222 -o StrictHostKeyChecking=no -o ConnectTimeout=10"));
}

TEST_F(RsyncPlanTest, RemoteToHostCreatesLocalDestination) {
    auto plan = planSync(nas_, "/volume1/photos", host_, "/srv/photos", true,
                         "/tmp");
    ASSERT_EQ(plan.legs.size(), 1u);
    ASSERT_TRUE(plan.localDestination.has_value());
    EXPECT_EQ(*plan.localDestination, fs::path("/srv/photos"));
    EXPECT_TRUE(contains(plan.legs[0], "--delete"));
}

TEST_F(RsyncPlanTest, RemoteToRemoteIsStaged) {
    auto plan = planSync(nas_, "/volume1/photos/", pi_, "/mnt/photos", false,
                         "/tmp/stage");
    EXPECT_TRUE(plan.staged);
    ASSERT_EQ(plan.legs.size(), 2u);
    EXPECT_EQ(plan.legs[0][plan.legs[0].size() - 2],
              "backup@10.0.0.2:/volume1/photos/");
    EXPECT_EQ(plan.legs[0].back(), "/tmp/stage/");
    EXPECT_EQ(plan.legs[1][plan.legs[1].size() - 2], "/tmp/stage/");
    EXPECT_EQ(plan.legs[1].back(), "pi@10.0.0.3:/mnt/photos");
}

TEST_F(RsyncPlanTest, RemoteToRemoteWithoutTrailingSlashPushesDirectory) {
    auto plan = planSync(nas_, "/volume1/photos", pi_, "/mnt", false,
                         "/tmp/stage");
    ASSERT_EQ(plan.legs.size(), 2u);
    EXPECT_EQ(plan.legs[1][plan.legs[1].size() - 2], "/tmp/stage/photos");
}

// ========== Output Tests ==========

TEST(RsyncOutputTest, FormatSize) {
    EXPECT_EQ(formatSize(1'234'567'890), "1.2GB");
    EXPECT_EQ(formatSize(15'400'000), "15MB");
    EXPECT_EQ(formatSize(900'000), "900KB");
}

TEST(RsyncOutputTest, ParseTransferSize) {
    const std::string output =
        "Number of files: 10\n"
        "Total file size: 1,234,567,890 bytes\n"
        "Total transferred file size: 1,000 bytes\n";
    EXPECT_EQ(parseTransferSize(output), "1.2GB");
}

TEST(RsyncOutputTest, ParseTransferSizeMissingLine) {
    EXPECT_EQ(parseTransferSize("sent 10 bytes  received 20 bytes\n"), "");
}

// ========== Staging Tests ==========

TEST(StagingAreaTest, CreatesAndRemovesDirectory) {
    fs::path created;
    {
        StagingArea area(fs::temp_directory_path());
        ASSERT_TRUE(area.ready());
        created = area.path();
        EXPECT_TRUE(fs::is_directory(created));
        std::ofstream(created / "file.txt") << "data";
    }
    EXPECT_FALSE(fs::exists(created));
}
