// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "dht/quorum_connector.hpp"
#include "util/completion_queue.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace torlink {
namespace dht {

using transport::TransportError;
using transport::TransportState;

const char *QuorumOutcomeAsString(QuorumOutcome outcome) {
  switch (outcome) {
  case QuorumOutcome::SUCCEEDED:
    return "succeeded";
  case QuorumOutcome::FAILED:
    return "failed";
  case QuorumOutcome::CANCELLED:
    return "cancelled";
  }
  return "unknown";
}

std::string JoinFailures(const std::vector<AttemptResult> &failures) {
  std::string out;
  for (const auto &failure : failures) {
    if (!out.empty()) {
      out += "; ";
    }
    out += "peer " + failure.peer.id + ": " + failure.state.ToString();
  }
  return out;
}

QuorumConnector::QuorumConnector(AttemptFunction attempt)
    : QuorumConnector(std::move(attempt), Options{}) {}

QuorumConnector::QuorumConnector(AttemptFunction attempt, Options options)
    : attempt_(std::move(attempt)), options_(options) {
  if (!attempt_) {
    throw std::invalid_argument("QuorumConnector requires an attempt function");
  }
}

QuorumConnector::~QuorumConnector() {
  // Stragglers reference attempt_; let them finish before members go away
  std::vector<std::shared_ptr<util::ThreadPool>> groups;
  {
    std::lock_guard<std::mutex> lock(stragglers_mutex_);
    groups.swap(stragglers_);
  }
  groups.clear();
}

void QuorumConnector::wait_idle() {
  std::vector<std::shared_ptr<util::ThreadPool>> groups;
  {
    std::lock_guard<std::mutex> lock(stragglers_mutex_);
    groups = stragglers_;
  }
  for (const auto &group : groups) {
    group->wait_idle();
  }
}

size_t QuorumConnector::straggler_groups() const {
  std::lock_guard<std::mutex> lock(stragglers_mutex_);
  size_t running = 0;
  for (const auto &group : stragglers_) {
    if (group->pending_tasks() > 0 || group->active_tasks() > 0) {
      ++running;
    }
  }
  return running;
}

void QuorumConnector::park(std::shared_ptr<util::ThreadPool> group) {
  group->shutdown();
  std::vector<std::shared_ptr<util::ThreadPool>> drained;
  {
    std::lock_guard<std::mutex> lock(stragglers_mutex_);
    auto it = std::partition(
        stragglers_.begin(), stragglers_.end(),
        [](const std::shared_ptr<util::ThreadPool> &g) {
          // Pending first: a task leaves the queue and becomes active under
          // the pool lock
          return g->pending_tasks() > 0 || g->active_tasks() > 0;
        });
    drained.assign(std::make_move_iterator(it),
                   std::make_move_iterator(stragglers_.end()));
    stragglers_.erase(it, stragglers_.end());
    stragglers_.push_back(std::move(group));
  }
  // Joined outside the lock
  drained.clear();
}

QuorumResult QuorumConnector::connect(const util::Context &ctx,
                                      const std::vector<PeerInfo> &peers,
                                      size_t min_required,
                                      TransportState &state) {
  QuorumResult result;
  const size_t total = peers.size();
  result.required = std::min(min_required, total);

  if (result.required == 0) {
    result.outcome = QuorumOutcome::SUCCEEDED;
    return result;
  }

  const size_t max_failures = total - result.required;
  auto queue = std::make_shared<util::CompletionQueue<AttemptResult>>(total);
  auto group = std::make_shared<util::ThreadPool>(total, "quorum");

  for (size_t i = 0; i < total; ++i) {
    if (i > 0 && options_.stagger.count() > 0 &&
        ctx.WaitFor(options_.stagger)) {
      LOG_DHT_DEBUG("quorum: context done after launching {} of {} attempts",
                    i, total);
      break;
    }

    PeerInfo peer = peers[i];
    auto task = [this, ctx, peer, queue]() {
      AttemptResult attempt;
      attempt.peer = peer;
      if (ctx.Done()) {
        attempt.state.Error(TransportError::CANCELLED, ctx.Error());
      } else {
        try {
          attempt.success = attempt_(ctx, peer, attempt.state);
        } catch (const std::exception &e) {
          attempt.success = false;
          attempt.state.Error(TransportError::DIAL_FAILED,
                              "connection attempt threw", e.what());
        }
        if (!attempt.success && attempt.state.IsValid()) {
          attempt.state.Error(TransportError::DIAL_FAILED,
                              "connection attempt failed");
        }
      }
      // Dropped when the caller already returned
      queue->Push(std::move(attempt));
    };

    if (!group->submit(std::move(task))) {
      AttemptResult rejected;
      rejected.peer = peers[i];
      rejected.state.Error(TransportError::DIAL_FAILED,
                           "attempt group is shut down");
      queue->Push(std::move(rejected));
    }
    ++result.attempted;
  }

  LOG_DHT_DEBUG("quorum: launched {} of {} attempts, need {}",
                result.attempted, total, result.required);

  for (;;) {
    auto next = queue->PopFor(options_.poll_interval);
    if (next) {
      if (next->success) {
        ++result.succeeded;
        LOG_DHT_DEBUG("quorum: connected to {} ({}/{})", next->peer.id,
                      result.succeeded, result.required);
      } else {
        LOG_DHT_DEBUG("quorum: attempt for {} failed: {}", next->peer.id,
                      next->state.ToString());
        result.failures.push_back(std::move(*next));
      }
    }

    if (result.succeeded >= result.required) {
      result.outcome = QuorumOutcome::SUCCEEDED;
      break;
    }
    // Failures caused by an expired context are reported as cancellation
    if (ctx.Done()) {
      result.outcome = QuorumOutcome::CANCELLED;
      result.cause = ctx.Error();
      state.Error(TransportError::CANCELLED,
                  "context errored with '" + result.cause + "'",
                  JoinFailures(result.failures));
      LOG_DHT_INFO("quorum cancelled after {} of {} connections: {}",
                   result.succeeded, result.required, result.cause);
      break;
    }
    if (result.failures.size() > max_failures) {
      result.outcome = QuorumOutcome::FAILED;
      state.Error(TransportError::QUORUM_UNREACHABLE,
                  "many failures, unable to get enough peers",
                  JoinFailures(result.failures));
      LOG_DHT_WARN("quorum unreachable: {} of {} attempts failed, needed {}",
                   result.failures.size(), total, result.required);
      break;
    }
  }

  queue->Close();
  park(std::move(group));
  return result;
}

} // namespace dht
} // namespace torlink
