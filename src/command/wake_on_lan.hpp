/*
 * wake_on_lan.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-02-12

Description: Wake-on-LAN magic packet construction and UDP broadcast

**************************************************/

#ifndef DEQ_COMMAND_WAKE_ON_LAN_HPP
#define DEQ_COMMAND_WAKE_ON_LAN_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace deq::command::wol {

using MacAddress = std::array<std::uint8_t, 6>;

inline constexpr std::size_t kMagicPacketSize = 102;
inline constexpr std::uint16_t kWakeOnLanPort = 9;

using MagicPacket = std::array<std::uint8_t, kMagicPacketSize>;

/**
 * @brief Accepts AA:BB:CC:DD:EE:FF, AA-BB-CC-DD-EE-FF and AABBCCDDEEFF.
 */
auto parseMac(std::string_view text) -> std::optional<MacAddress>;

/**
 * @brief Six 0xFF bytes followed by the MAC repeated 16 times.
 */
auto buildMagicPacket(const MacAddress& mac) -> MagicPacket;

/**
 * @brief Broadcasts a magic packet for @p mac to @p broadcast:9.
 * @return Empty string on success, otherwise the failure reason
 */
auto sendMagicPacket(std::string_view mac, const std::string& broadcast)
    -> std::string;

}  // namespace deq::command::wol

#endif  // DEQ_COMMAND_WAKE_ON_LAN_HPP
