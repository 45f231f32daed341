// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace torlink {
namespace transport {

/**
 * Failure kinds reported by the transport, listener and quorum connector
 */
enum class TransportError {
  NONE,
  // Malformed or semantically wrong address; pick another address or abort
  ADDRESS_FORMAT_INVALID,
  // Overlay bootstrap failed; fatal for this transport instance
  SESSION_INIT_FAILED,
  // Per-attempt dial failure (timeout, refusal, overlay error)
  DIAL_FAILED,
  // Security/multiplexing negotiation failed; raw connection already closed
  UPGRADE_FAILED,
  // Hidden service could not be published
  SERVICE_REGISTRATION_FAILED,
  // Listener construction failed after the service was published (rolled back)
  LISTENER_SETUP_FAILED,
  // Accept source closed
  LISTENER_CLOSED,
  // Too many attempts failed to ever reach the required connection count
  QUORUM_UNREACHABLE,
  // Deadline or external cancellation
  CANCELLED,
  // Content routing collaborator failure
  ROUTING_FAILED,
};

std::string TransportErrorAsString(TransportError error);

/**
 * TransportState - records why a transport operation failed
 *
 * Operations return bool (or a null pointer) and fill a TransportState:
 *
 *   TransportState state;
 *   auto conn = transport.dial(ctx, addr, peer, state);
 *   if (!conn) LOG_NET_DEBUG("dial failed: {}", state.ToString());
 *
 * Error() always returns false so it can end a failing branch directly:
 *
 *   return state.Error(TransportError::DIAL_FAILED, "connection refused");
 */
class TransportState {
public:
  TransportState() = default;

  bool IsValid() const { return error_ == TransportError::NONE; }
  bool IsError() const { return !IsValid(); }

  bool Error(TransportError error, const std::string &reason,
             const std::string &debug_message = "") {
    error_ = error;
    reason_ = reason;
    debug_message_ = debug_message;
    return false;
  }

  void Reset() {
    error_ = TransportError::NONE;
    reason_.clear();
    debug_message_.clear();
  }

  TransportError GetError() const { return error_; }
  const std::string &GetReason() const { return reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

  // "<kind>: <reason> (<debug>)"
  std::string ToString() const;

private:
  TransportError error_ = TransportError::NONE;
  std::string reason_;
  std::string debug_message_;
};

} // namespace transport
} // namespace torlink
