// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "util/threadpool.hpp"
#include "util/logging.hpp"

namespace torlink {
namespace util {

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : name_(std::move(name)) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) {
      num_threads = 4;
    }
  }
  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this, i] { worker_loop(i); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

bool ThreadPool::submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_.load(std::memory_order_acquire)) {
      return false;
    }
    tasks_.push(std::move(task));
  }
  work_cv_.notify_one();
  return true;
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_.store(true, std::memory_order_release);
  }
  work_cv_.notify_all();
}

void ThreadPool::wait_idle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] {
    return tasks_.empty() && active_.load(std::memory_order_acquire) == 0;
  });
}

size_t ThreadPool::pending_tasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void ThreadPool::worker_loop(size_t index) {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] {
        return stop_.load(std::memory_order_acquire) || !tasks_.empty();
      });
      if (tasks_.empty()) {
        return; // stopped and drained
      }
      task = std::move(tasks_.front());
      tasks_.pop();
      active_.fetch_add(1, std::memory_order_acq_rel);
    }

    try {
      task();
      completed_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception &e) {
      exceptions_.fetch_add(1, std::memory_order_relaxed);
      LOG_ERROR("{} worker {} task threw: {}", name_, index, e.what());
    } catch (...) {
      exceptions_.fetch_add(1, std::memory_order_relaxed);
      LOG_ERROR("{} worker {} task threw a non-standard exception", name_,
                index);
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      active_.fetch_sub(1, std::memory_order_acq_rel);
      if (tasks_.empty() && active_.load(std::memory_order_acquire) == 0) {
        idle_cv_.notify_all();
      }
    }
  }
}

} // namespace util
} // namespace torlink
