// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "scan/records.hpp"

#include <mutex>
#include <vector>

namespace netsnmp {
namespace scan {

// ResultSink - append-only destination for discovered records.
// Called from worker threads; implementations lock internally.
class ResultSink {
public:
  virtual ~ResultSink() = default;

  virtual void OnHost(const HostRecord& host) = 0;
  virtual void OnNeighbor(const NeighborRecord& neighbor) = 0;
};

// CollectingSink - keeps records in memory, in completion order
class CollectingSink : public ResultSink {
public:
  void OnHost(const HostRecord& host) override;
  void OnNeighbor(const NeighborRecord& neighbor) override;

  std::vector<HostRecord> hosts() const;
  std::vector<NeighborRecord> neighbors() const;

private:
  mutable std::mutex mutex_;
  std::vector<HostRecord> hosts_;
  std::vector<NeighborRecord> neighbors_;
};

}  // namespace scan
}  // namespace netsnmp
