// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "util/context.hpp"
#include <algorithm>

namespace torlink {
namespace util {

Context::Context() : state_(std::make_shared<State>()) {}

Context Context::Derive(const Context &parent,
                        std::optional<Clock::time_point> deadline) {
  auto child = std::make_shared<State>();

  std::string parent_cause;
  bool parent_cancelled = false;
  {
    std::lock_guard<std::mutex> lock(parent.state_->mutex);
    auto &pd = parent.state_->deadline;
    if (pd && (!deadline || *pd < *deadline)) {
      deadline = pd;
    }
    parent_cancelled = parent.state_->cancelled;
    parent_cause = parent.state_->cause;
    if (!parent_cancelled) {
      auto &siblings = parent.state_->children;
      siblings.erase(std::remove_if(siblings.begin(), siblings.end(),
                                    [](const std::weak_ptr<State> &w) {
                                      return w.expired();
                                    }),
                     siblings.end());
      siblings.push_back(child);
    }
  }

  child->deadline = deadline;
  if (parent_cancelled) {
    child->cancelled = true;
    child->cause = parent_cause;
  }
  return Context(std::move(child));
}

Context Context::WithCancel(const Context &parent) {
  return Derive(parent, std::nullopt);
}

Context Context::WithDeadline(const Context &parent,
                              Clock::time_point deadline) {
  return Derive(parent, deadline);
}

Context Context::WithTimeout(const Context &parent, Clock::duration timeout) {
  return Derive(parent, Clock::now() + timeout);
}

void Context::CancelState(const std::shared_ptr<State> &state,
                          const std::string &cause) {
  std::vector<std::weak_ptr<State>> children;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->cancelled) {
      return;
    }
    state->cancelled = true;
    state->cause = cause;
    children.swap(state->children);
  }
  state->cv.notify_all();
  for (auto &weak : children) {
    if (auto child = weak.lock()) {
      CancelState(child, cause);
    }
  }
}

void Context::Cancel(const std::string &cause) const {
  CancelState(state_, cause);
}

bool Context::Done() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->cancelled) {
    return true;
  }
  return state_->deadline && Clock::now() >= *state_->deadline;
}

std::string Context::Error() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->cancelled) {
    return state_->cause;
  }
  if (state_->deadline && Clock::now() >= *state_->deadline) {
    return kDeadlineExceeded;
  }
  return "";
}

std::optional<Context::Clock::time_point> Context::Deadline() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->deadline;
}

std::optional<Context::Clock::duration> Context::Remaining() const {
  auto deadline = Deadline();
  if (!deadline) {
    return std::nullopt;
  }
  auto now = Clock::now();
  if (now >= *deadline) {
    return Clock::duration::zero();
  }
  return *deadline - now;
}

bool Context::WaitFor(Clock::duration duration) const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  auto until = Clock::now() + duration;
  if (state_->deadline && *state_->deadline < until) {
    until = *state_->deadline;
  }
  state_->cv.wait_until(lock, until, [this] { return state_->cancelled; });
  if (state_->cancelled) {
    return true;
  }
  return state_->deadline && Clock::now() >= *state_->deadline;
}

} // namespace util
} // namespace torlink
