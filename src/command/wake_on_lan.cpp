/*
 * wake_on_lan.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "wake_on_lan.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

namespace deq::command::wol {

namespace {

auto hexValue(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

class UdpSocket {
public:
    UdpSocket() : fd_(::socket(AF_INET, SOCK_DGRAM, 0)) {}
    ~UdpSocket() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    [[nodiscard]] auto valid() const -> bool { return fd_ >= 0; }
    [[nodiscard]] auto fd() const -> int { return fd_; }

private:
    int fd_;
};

}  // namespace

auto parseMac(std::string_view text) -> std::optional<MacAddress> {
    std::string digits;
    for (char c : text) {
        if (c == ':' || c == '-') {
            continue;
        }
        if (hexValue(c) < 0) {
            return std::nullopt;
        }
        digits.push_back(c);
    }
    if (digits.size() != 12) {
        return std::nullopt;
    }

    MacAddress mac{};
    for (std::size_t i = 0; i < mac.size(); ++i) {
        mac[i] = static_cast<std::uint8_t>(hexValue(digits[2 * i]) * 16 +
                                           hexValue(digits[2 * i + 1]));
    }
    return mac;
}

auto buildMagicPacket(const MacAddress& mac) -> MagicPacket {
    MagicPacket packet{};
    std::fill_n(packet.begin(), 6, std::uint8_t{0xFF});
    for (std::size_t rep = 0; rep < 16; ++rep) {
        std::copy(mac.begin(), mac.end(), packet.begin() + 6 + rep * 6);
    }
    return packet;
}

auto sendMagicPacket(std::string_view mac, const std::string& broadcast)
    -> std::string {
    auto address = parseMac(mac);
    if (!address) {
        return "Invalid MAC address";
    }

    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(kWakeOnLanPort);
    if (::inet_pton(AF_INET, broadcast.c_str(), &target.sin_addr) != 1) {
        return "Invalid broadcast address: " + broadcast;
    }

    UdpSocket sock;
    if (!sock.valid()) {
        return std::string("socket: ") + std::strerror(errno);
    }
    int enable = 1;
    if (::setsockopt(sock.fd(), SOL_SOCKET, SO_BROADCAST, &enable,
                     sizeof(enable)) != 0) {
        return std::string("setsockopt: ") + std::strerror(errno);
    }

    auto packet = buildMagicPacket(*address);
    auto sent = ::sendto(sock.fd(), packet.data(), packet.size(), 0,
                         reinterpret_cast<const sockaddr*>(&target),
                         sizeof(target));
    if (sent != static_cast<ssize_t>(packet.size())) {
        return std::string("sendto: ") + std::strerror(errno);
    }

    spdlog::info("Sent Wake-on-LAN packet to {} via {}:{}", mac, broadcast,
                 kWakeOnLanPort);
    return {};
}

}  // namespace deq::command::wol
