// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace torlink {
namespace util {

/**
 * Fixed-size worker pool for fire-and-forget tasks
 *
 * Tasks report their outcome through whatever channel they capture (a
 * CompletionQueue in the quorum connector); the pool only runs them.
 *
 * - submit() returns false once shutdown() was called.
 * - Exceptions escaping a task are logged and counted; the worker survives.
 * - wait_idle() blocks until the queue is empty and no task is running.
 * - The destructor stops intake, lets queued tasks finish, and joins.
 *
 * Usage:
 *   ThreadPool pool(8, "dial");
 *   pool.submit([&] { attempt(peer); });
 *   pool.wait_idle();
 */
class ThreadPool {
public:
  /**
   * @param num_threads Worker threads (0 = hardware concurrency)
   * @param name        Label used in log messages
   */
  explicit ThreadPool(size_t num_threads = 0, std::string name = "pool");
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  bool submit(std::function<void()> task);

  // Stop accepting tasks; queued tasks still run
  void shutdown();

  void wait_idle();

  size_t size() const { return workers_.size(); }
  size_t pending_tasks() const;
  size_t active_tasks() const { return active_.load(std::memory_order_acquire); }
  size_t tasks_completed() const {
    return completed_.load(std::memory_order_relaxed);
  }
  size_t task_exceptions() const {
    return exceptions_.load(std::memory_order_relaxed);
  }
  bool is_stopped() const { return stop_.load(std::memory_order_acquire); }

private:
  void worker_loop(size_t index);

  std::string name_;
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::atomic<bool> stop_{false};
  std::atomic<size_t> active_{0};
  std::atomic<size_t> completed_{0};
  std::atomic<size_t> exceptions_{0};
};

} // namespace util
} // namespace torlink
