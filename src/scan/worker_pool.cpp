// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/worker_pool.hpp"

#include "util/logging.hpp"

#include <stdexcept>

#include <asio/post.hpp>

namespace netsnmp {
namespace scan {

WorkerPool::WorkerPool(size_t worker_cap) : worker_cap_(worker_cap) {
  if (worker_cap_ == 0) {
    throw std::invalid_argument("worker cap must be positive");
  }

  work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(io_context_));

  threads_.reserve(worker_cap_);
  for (size_t i = 0; i < worker_cap_; ++i) {
    threads_.emplace_back([this]() { io_context_.run(); });
  }
  LOG_SCAN_TRACE("WorkerPool started with {} threads", worker_cap_);
}

WorkerPool::~WorkerPool() {
  Wait();
  work_guard_.reset();
  io_context_.stop();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

void WorkerPool::Post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++pending_;
  }
  asio::post(io_context_, [this, task = std::move(task)]() { RunTask(task); });
}

void WorkerPool::RunTask(const std::function<void()>& task) {
  size_t now_running = in_flight_.fetch_add(1) + 1;
  size_t peak = peak_in_flight_.load();
  while (now_running > peak && !peak_in_flight_.compare_exchange_weak(peak, now_running)) {
  }

  try {
    task();
  } catch (const std::exception& e) {
    LOG_SCAN_ERROR("Worker task failed: {}", e.what());
  } catch (...) {
    LOG_SCAN_ERROR("Worker task failed with a non-standard exception");
  }

  in_flight_.fetch_sub(1);
  completed_.fetch_add(1);

  std::lock_guard<std::mutex> lock(mutex_);
  if (--pending_ == 0) {
    idle_cv_.notify_all();
  }
}

void WorkerPool::Wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this]() { return pending_ == 0; });
}

}  // namespace scan
}  // namespace netsnmp
