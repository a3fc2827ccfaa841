/*
 * test_wake_on_lan.cpp - Tests for magic packet construction
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "command/wake_on_lan.hpp"

using namespace deq::command::wol;

// ========== MAC Parsing Tests ==========

TEST(WakeOnLanTest, ParsesSupportedNotations) {
    const MacAddress expected{0xAA, 0xBB, 0xCC, 0x01, 0x02, 0x0f};
    EXPECT_EQ(parseMac("AA:BB:CC:01:02:0F"), expected);
    EXPECT_EQ(parseMac("aa-bb-cc-01-02-0f"), expected);
    EXPECT_EQ(parseMac("aabbcc01020f"), expected);
}

TEST(WakeOnLanTest, RejectsMalformedMac) {
    EXPECT_FALSE(parseMac("").has_value());
    EXPECT_FALSE(parseMac("AA:BB:CC:DD:EE").has_value());
    EXPECT_FALSE(parseMac("AA:BB:CC:DD:EE:FF:00").has_value());
    EXPECT_FALSE(parseMac("ZZ:BB:CC:DD:EE:FF").has_value());
}

// ========== Packet Tests ==========

TEST(WakeOnLanTest, MagicPacketLayout) {
    const MacAddress mac{0x00, 0x11, 0x22, 0x33, 0x44, 0x55};
    auto packet = buildMagicPacket(mac);

    ASSERT_EQ(packet.size(), 102u);
    for (std::size_t i = 0; i < 6; ++i) {
        EXPECT_EQ(packet[i], 0xFF) << "header byte " << i;
    }
    for (std::size_t rep = 0; rep < 16; ++rep) {
        for (std::size_t i = 0; i < 6; ++i) {
            EXPECT_EQ(packet[6 + rep * 6 + i], mac[i])
                << "repetition " << rep << " byte " << i;
        }
    }
}

TEST(WakeOnLanTest, SendRejectsBadInputBeforeOpeningSocket) {
    EXPECT_EQ(sendMagicPacket("not-a-mac", "255.255.255.255"),
              "Invalid MAC address");
    EXPECT_EQ(sendMagicPacket("AA:BB:CC:DD:EE:FF", "broadcast"),
              "Invalid broadcast address: broadcast");
}
