// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 WorkerPool - bounded-concurrency task runner

 An asio::io_context run by exactly worker_cap threads, kept alive by a work
 guard. Posted tasks run on those threads, so no more than worker_cap tasks
 are ever in flight. Wait() blocks until every task posted so far finished.

 Both discovery passes share this type. A task that throws is logged and
 counted as finished; the batch goes on.
*/

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

namespace netsnmp {
namespace scan {

class WorkerPool {
public:
  static constexpr size_t DEFAULT_WORKER_CAP = 25;

  // Throws std::invalid_argument if worker_cap == 0
  explicit WorkerPool(size_t worker_cap = DEFAULT_WORKER_CAP);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Post(std::function<void()> task);

  // Block until every posted task completed
  void Wait();

  size_t worker_cap() const { return worker_cap_; }

  // Highest number of tasks observed running at the same time
  size_t peak_in_flight() const { return peak_in_flight_.load(); }

  size_t completed() const { return completed_.load(); }

private:
  void RunTask(const std::function<void()>& task);

  const size_t worker_cap_;
  asio::io_context io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> threads_;

  std::mutex mutex_;
  std::condition_variable idle_cv_;
  size_t pending_{0};  // posted, not yet finished (guarded by mutex_)

  std::atomic<size_t> in_flight_{0};
  std::atomic<size_t> peak_in_flight_{0};
  std::atomic<size_t> completed_{0};
};

}  // namespace scan
}  // namespace netsnmp
