// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/result_sink.hpp"

namespace netsnmp {
namespace scan {

void CollectingSink::OnHost(const HostRecord& host) {
  std::lock_guard<std::mutex> lock(mutex_);
  hosts_.push_back(host);
}

void CollectingSink::OnNeighbor(const NeighborRecord& neighbor) {
  std::lock_guard<std::mutex> lock(mutex_);
  neighbors_.push_back(neighbor);
}

std::vector<HostRecord> CollectingSink::hosts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hosts_;
}

std::vector<NeighborRecord> CollectingSink::neighbors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return neighbors_;
}

}  // namespace scan
}  // namespace netsnmp
