// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace torlink {
namespace util {

/**
 * CompletionQueue - bounded multi-producer queue for task results
 *
 * Producers are worker tasks reporting exactly one result each; the single
 * consumer pops results in completion order. Capacity is the number of
 * tasks launched, so Push() never has to wait in that usage. Once Close()
 * was called further pushes are dropped, which lets late tasks finish after
 * the consumer has stopped listening.
 */
template <typename T>
class CompletionQueue {
public:
  explicit CompletionQueue(size_t capacity) : capacity_(capacity) {}

  CompletionQueue(const CompletionQueue &) = delete;
  CompletionQueue &operator=(const CompletionQueue &) = delete;

  // Returns false if the queue is closed or full
  bool Push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_ || items_.size() >= capacity_) {
        return false;
      }
      items_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  // Wait up to `timeout` for the next result
  template <typename Rep, typename Period>
  std::optional<T> PopFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    items_.clear();
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_ = false;
};

} // namespace util
} // namespace torlink
