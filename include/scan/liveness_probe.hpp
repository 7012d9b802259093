// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace netsnmp {
namespace scan {

// LivenessProbe - reachability check run before SNMP is attempted.
// Implementations must be safe to call from several worker threads at once.
class LivenessProbe {
public:
  virtual ~LivenessProbe() = default;

  virtual bool IsAlive(const std::string& address, std::chrono::milliseconds timeout) = 0;
};

// IcmpLivenessProbe - one ICMP echo request per address over an asio raw
// socket. Raw sockets need root or CAP_NET_RAW; Create() returns nullptr when
// one cannot be opened so the caller can skip the liveness pass.
class IcmpLivenessProbe : public LivenessProbe {
  struct CreateTag {
    explicit CreateTag() = default;
  };

public:
  static std::unique_ptr<IcmpLivenessProbe> Create();

  // Only reachable through Create()
  explicit IcmpLivenessProbe(CreateTag);

  bool IsAlive(const std::string& address, std::chrono::milliseconds timeout) override;

private:

  const uint16_t identifier_;
  std::atomic<uint16_t> next_sequence_{1};
};

// RFC 1071 internet checksum (exposed for tests)
uint16_t InternetChecksum(const uint8_t* data, size_t size);

}  // namespace scan
}  // namespace netsnmp
