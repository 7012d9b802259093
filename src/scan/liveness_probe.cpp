// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/liveness_probe.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <array>
#include <functional>
#include <system_error>

#include <unistd.h>

#include <asio.hpp>

namespace netsnmp {
namespace scan {

namespace {

constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr size_t ICMP_HEADER_SIZE = 8;
constexpr size_t IPV4_MIN_HEADER_SIZE = 20;

std::array<uint8_t, ICMP_HEADER_SIZE> BuildEchoRequest(uint16_t identifier, uint16_t sequence) {
  std::array<uint8_t, ICMP_HEADER_SIZE> packet{};
  packet[0] = ICMP_ECHO_REQUEST;
  packet[1] = 0;
  packet[4] = static_cast<uint8_t>(identifier >> 8);
  packet[5] = static_cast<uint8_t>(identifier & 0xFF);
  packet[6] = static_cast<uint8_t>(sequence >> 8);
  packet[7] = static_cast<uint8_t>(sequence & 0xFF);
  uint16_t checksum = InternetChecksum(packet.data(), packet.size());
  packet[2] = static_cast<uint8_t>(checksum >> 8);
  packet[3] = static_cast<uint8_t>(checksum & 0xFF);
  return packet;
}

// A raw ICMP socket receives every ICMP packet for the host; only our own
// echo reply counts.
bool IsMatchingReply(const uint8_t* data, size_t size, uint16_t identifier, uint16_t sequence) {
  if (size < IPV4_MIN_HEADER_SIZE) {
    return false;
  }
  size_t ip_header = static_cast<size_t>(data[0] & 0x0F) * 4;
  if (ip_header < IPV4_MIN_HEADER_SIZE || size < ip_header + ICMP_HEADER_SIZE) {
    return false;
  }
  const uint8_t* icmp = data + ip_header;
  uint16_t id = static_cast<uint16_t>((icmp[4] << 8) | icmp[5]);
  uint16_t seq = static_cast<uint16_t>((icmp[6] << 8) | icmp[7]);
  return icmp[0] == ICMP_ECHO_REPLY && id == identifier && seq == sequence;
}

}  // namespace

uint16_t InternetChecksum(const uint8_t* data, size_t size) {
  uint32_t sum = 0;
  for (size_t i = 0; i + 1 < size; i += 2) {
    sum += static_cast<uint32_t>((data[i] << 8) | data[i + 1]);
  }
  if (size % 2 != 0) {
    sum += static_cast<uint32_t>(data[size - 1] << 8);
  }
  while (sum >> 16) {
    sum = (sum & 0xFFFF) + (sum >> 16);
  }
  return static_cast<uint16_t>(~sum);
}

IcmpLivenessProbe::IcmpLivenessProbe(CreateTag) : identifier_(static_cast<uint16_t>(::getpid() & 0xFFFF)) {}

std::unique_ptr<IcmpLivenessProbe> IcmpLivenessProbe::Create() {
  try {
    asio::io_context io_context;
    asio::ip::icmp::socket socket(io_context, asio::ip::icmp::v4());
  } catch (const std::system_error& e) {
    LOG_SCAN_INFO("ICMP liveness unavailable ({}), every address will be probed over SNMP", e.what());
    return nullptr;
  }
  return std::make_unique<IcmpLivenessProbe>(CreateTag{});
}

bool IcmpLivenessProbe::IsAlive(const std::string& address, std::chrono::milliseconds timeout) {
  // Dotted quads may carry leading zeros ("10.0.0.07"), which inet_pton rejects
  auto octets = util::ParseIPv4(address);
  if (!octets) {
    LOG_SCAN_WARN("Liveness: invalid address {}", address);
    return false;
  }
  const asio::ip::address_v4 target(*octets);

  const uint16_t sequence = next_sequence_.fetch_add(1, std::memory_order_relaxed);
  const auto request = BuildEchoRequest(identifier_, sequence);

  try {
    asio::io_context io_context;
    asio::ip::icmp::socket socket(io_context, asio::ip::icmp::v4());
    asio::ip::icmp::endpoint destination(target, 0);
    socket.send_to(asio::buffer(request), destination);

    std::array<uint8_t, 1500> buffer{};
    asio::ip::icmp::endpoint sender;
    bool alive = false;

    asio::steady_timer timer(io_context);
    timer.expires_after(timeout);
    timer.async_wait([&socket](const std::error_code& timer_ec) {
      if (!timer_ec) {
        socket.cancel();
      }
    });

    std::function<void(const std::error_code&, size_t)> on_receive;
    on_receive = [&](const std::error_code& recv_ec, size_t bytes) {
      if (recv_ec) {
        return;  // cancelled by the timer
      }
      if (sender.address() == destination.address() && IsMatchingReply(buffer.data(), bytes, identifier_, sequence)) {
        alive = true;
        timer.cancel();
        return;
      }
      socket.async_receive_from(asio::buffer(buffer), sender, on_receive);
    };
    socket.async_receive_from(asio::buffer(buffer), sender, on_receive);

    io_context.run();
    LOG_SCAN_TRACE("Liveness: {} {}", address, alive ? "alive" : "no reply");
    return alive;
  } catch (const std::system_error& e) {
    LOG_SCAN_WARN_RL("Liveness: ICMP to {} failed: {}", address, e.what());
    return false;
  }
}

}  // namespace scan
}  // namespace netsnmp
