// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "transport/transport_state.hpp"

namespace torlink {
namespace transport {

std::string TransportErrorAsString(TransportError error) {
  switch (error) {
  case TransportError::NONE:
    return "ok";
  case TransportError::ADDRESS_FORMAT_INVALID:
    return "address-format-invalid";
  case TransportError::SESSION_INIT_FAILED:
    return "session-init-failed";
  case TransportError::DIAL_FAILED:
    return "dial-failed";
  case TransportError::UPGRADE_FAILED:
    return "upgrade-failed";
  case TransportError::SERVICE_REGISTRATION_FAILED:
    return "service-registration-failed";
  case TransportError::LISTENER_SETUP_FAILED:
    return "listener-setup-failed";
  case TransportError::LISTENER_CLOSED:
    return "listener-closed";
  case TransportError::QUORUM_UNREACHABLE:
    return "quorum-unreachable";
  case TransportError::CANCELLED:
    return "cancelled";
  case TransportError::ROUTING_FAILED:
    return "routing-failed";
  }
  return "unknown";
}

std::string TransportState::ToString() const {
  if (IsValid()) {
    return "ok";
  }
  std::string out = TransportErrorAsString(error_) + ": " + reason_;
  if (!debug_message_.empty()) {
    out += " (" + debug_message_ + ")";
  }
  return out;
}

} // namespace transport
} // namespace torlink
