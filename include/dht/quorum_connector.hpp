// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "dht/peer_info.hpp"
#include "transport/transport_state.hpp"
#include "util/context.hpp"
#include "util/threadpool.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace torlink {
namespace dht {

enum class QuorumOutcome { SUCCEEDED, FAILED, CANCELLED };

const char *QuorumOutcomeAsString(QuorumOutcome outcome);

// Outcome of one connection attempt
struct AttemptResult {
  PeerInfo peer;
  bool success = false;
  transport::TransportState state;
};

struct QuorumResult {
  QuorumOutcome outcome = QuorumOutcome::FAILED;
  // Effective requirement after clamping to the candidate count
  size_t required = 0;
  size_t attempted = 0;
  size_t succeeded = 0;
  // Failures observed before the call returned, in completion order
  std::vector<AttemptResult> failures;
  // Context error text for CANCELLED
  std::string cause;

  bool ok() const { return outcome == QuorumOutcome::SUCCEEDED; }
};

// Performs one attempt; must honor `ctx`
using AttemptFunction = std::function<bool(
    const util::Context &, const PeerInfo &, transport::TransportState &)>;

/**
 * QuorumConnector - connect to at least R of N candidate peers
 *
 * Every call gets its own task group with one worker per candidate, so a
 * hanging attempt never holds back another candidate. The caller launches
 * the attempts one by one, sleeping `stagger` between launches, then waits.
 * It returns as soon as R attempts succeeded, as soon as more than N - R
 * failed (R can no longer be reached), or when `ctx` is done. If `ctx`
 * expires while launching, the remaining candidates are not tried.
 * R larger than N is clamped to N; R = 0 succeeds without launching
 * anything.
 *
 * Attempts still running when the call returns keep going in their group
 * and their results are discarded. Drained groups are released on the next
 * call; the destructor waits for the rest.
 *
 * Failure reporting:
 *   QUORUM_UNREACHABLE  "many failures, unable to get enough peers"
 *   CANCELLED           "context errored with '<cause>'"
 * with every collected failure reason joined into the debug message.
 */
class QuorumConnector {
public:
  struct Options {
    std::chrono::milliseconds stagger{100};
    // Granularity at which the waiting caller notices cancellation
    std::chrono::milliseconds poll_interval{50};
  };

  explicit QuorumConnector(AttemptFunction attempt);
  QuorumConnector(AttemptFunction attempt, Options options);
  ~QuorumConnector();

  QuorumConnector(const QuorumConnector &) = delete;
  QuorumConnector &operator=(const QuorumConnector &) = delete;

  QuorumResult connect(const util::Context &ctx,
                       const std::vector<PeerInfo> &peers, size_t min_required,
                       transport::TransportState &state);

  // Blocks until every launched attempt has finished
  void wait_idle();

  // Task groups still running attempts of earlier calls
  size_t straggler_groups() const;

private:
  void park(std::shared_ptr<util::ThreadPool> group);

  AttemptFunction attempt_;
  Options options_;

  mutable std::mutex stragglers_mutex_;
  std::vector<std::shared_ptr<util::ThreadPool>> stragglers_;
};

// "peer <id>: <state>" for every failure, separated by "; "
std::string JoinFailures(const std::vector<AttemptResult> &failures);

} // namespace dht
} // namespace torlink
