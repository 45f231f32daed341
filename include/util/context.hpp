// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace torlink {
namespace util {

/**
 * Context - deadline and cancellation signal passed down blocking calls
 *
 * A default-constructed Context never expires. Derived contexts inherit the
 * parent's deadline (the earlier one wins) and are cancelled together with
 * the parent. Copies share state: cancelling any copy cancels them all.
 *
 * Blocking operations (overlay dial, handshakes, hidden service setup, the
 * quorum wait loop) poll Done() or sleep through WaitFor() so that a cancel
 * from another thread is observed within one wait slice.
 *
 * Usage:
 *   auto ctx = Context::WithTimeout(Context(), std::chrono::seconds(60));
 *   while (!ctx.Done()) { ... }
 *   if (ctx.Done()) LOG_WARN("gave up: {}", ctx.Error());
 */
class Context {
public:
  using Clock = std::chrono::steady_clock;

  static constexpr const char *kCanceled = "context canceled";
  static constexpr const char *kDeadlineExceeded = "context deadline exceeded";

  Context();

  static Context WithCancel(const Context &parent);
  static Context WithDeadline(const Context &parent, Clock::time_point deadline);
  static Context WithTimeout(const Context &parent, Clock::duration timeout);

  // Cancel this context and every context derived from it
  void Cancel(const std::string &cause = kCanceled) const;

  bool Done() const;

  // Empty while not done, otherwise the cancel cause or kDeadlineExceeded
  std::string Error() const;

  std::optional<Clock::time_point> Deadline() const;

  // Time left before the deadline (nullopt when there is none, zero if passed)
  std::optional<Clock::duration> Remaining() const;

  /**
   * Sleep up to `duration`, waking early on cancel or deadline
   * @return Done() after waking
   */
  bool WaitFor(Clock::duration duration) const;

private:
  struct State {
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    std::string cause;
    std::optional<Clock::time_point> deadline;
    std::vector<std::weak_ptr<State>> children;
  };

  explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

  static Context Derive(const Context &parent,
                        std::optional<Clock::time_point> deadline);
  static void CancelState(const std::shared_ptr<State> &state,
                          const std::string &cause);

  std::shared_ptr<State> state_;
};

} // namespace util
} // namespace torlink
