// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "transport/plaintext_upgrader.hpp"
#include "util/logging.hpp"
#include <stdexcept>
#include <vector>

namespace torlink {
namespace transport {

PlaintextConnection::~PlaintextConnection() { close(); }

size_t PlaintextConnection::read_some(const util::Context &ctx, uint8_t *data,
                                      size_t size,
                                      boost::system::error_code &ec) {
  return conn_->raw().read_some(ctx, data, size, ec);
}

size_t PlaintextConnection::write_all(const util::Context &ctx,
                                      const uint8_t *data, size_t size,
                                      boost::system::error_code &ec) {
  return conn_->raw().write_all(ctx, data, size, ec);
}

void PlaintextConnection::close() {
  if (!closed_.exchange(true)) {
    conn_->close();
  }
}

PlaintextUpgrader::PlaintextUpgrader(PeerId local_peer)
    : local_peer_(std::move(local_peer)) {
  if (local_peer_.empty() || local_peer_.size() > MAX_PEER_ID_LENGTH) {
    throw std::invalid_argument("invalid local peer id");
  }
}

bool PlaintextUpgrader::exchange_hello(const util::Context &ctx,
                                       MultiaddrConnection &conn,
                                       PeerId &remote,
                                       TransportState &state) const {
  std::vector<uint8_t> hello;
  hello.reserve(3 + local_peer_.size());
  hello.push_back(PROTOCOL_VERSION);
  hello.push_back(static_cast<uint8_t>(local_peer_.size() >> 8));
  hello.push_back(static_cast<uint8_t>(local_peer_.size() & 0xff));
  hello.insert(hello.end(), local_peer_.begin(), local_peer_.end());

  boost::system::error_code ec;
  conn.raw().write_all(ctx, hello.data(), hello.size(), ec);
  if (ec) {
    return state.Error(TransportError::UPGRADE_FAILED, "sending hello failed",
                       ec.message());
  }

  uint8_t header[3];
  if (!ReadExact(conn.raw(), ctx, header, sizeof(header), ec)) {
    return state.Error(TransportError::UPGRADE_FAILED, "reading hello failed",
                       ec.message());
  }
  if (header[0] != PROTOCOL_VERSION) {
    return state.Error(TransportError::UPGRADE_FAILED,
                       "unsupported hello version",
                       std::to_string(header[0]));
  }
  const size_t length = (static_cast<size_t>(header[1]) << 8) | header[2];
  if (length == 0 || length > MAX_PEER_ID_LENGTH) {
    return state.Error(TransportError::UPGRADE_FAILED,
                       "invalid peer id length", std::to_string(length));
  }

  std::string id(length, '\0');
  if (!ReadExact(conn.raw(), ctx, reinterpret_cast<uint8_t *>(id.data()),
                 length, ec)) {
    return state.Error(TransportError::UPGRADE_FAILED,
                       "reading peer id failed", ec.message());
  }
  remote = std::move(id);
  return true;
}

ConnectionPtr
PlaintextUpgrader::upgrade_outbound(const util::Context &ctx,
                                    const MultiaddrConnectionPtr &conn,
                                    const PeerId &remote_peer,
                                    TransportState &state) {
  PeerId remote;
  if (!exchange_hello(ctx, *conn, remote, state)) {
    return nullptr;
  }
  if (remote != remote_peer) {
    state.Error(TransportError::UPGRADE_FAILED, "peer id mismatch",
                "expected " + remote_peer + ", got " + remote);
    return nullptr;
  }
  LOG_NET_TRACE("outbound upgrade to {} complete", remote);
  return std::make_shared<PlaintextConnection>(conn, local_peer_,
                                               std::move(remote));
}

ConnectionPtr
PlaintextUpgrader::upgrade_inbound(const util::Context &ctx,
                                   const MultiaddrConnectionPtr &conn,
                                   TransportState &state) {
  PeerId remote;
  if (!exchange_hello(ctx, *conn, remote, state)) {
    return nullptr;
  }
  LOG_NET_TRACE("inbound upgrade from {} complete", remote);
  return std::make_shared<PlaintextConnection>(conn, local_peer_,
                                               std::move(remote));
}

} // namespace transport
} // namespace torlink
