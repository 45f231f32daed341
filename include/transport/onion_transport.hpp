// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "transport/address_codec.hpp"
#include "transport/overlay.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <memory>
#include <mutex>

namespace torlink {
namespace transport {

struct TransportConfig {
  // Frame every stream as websocket ("/ws" addresses)
  bool websocket = false;
  std::chrono::milliseconds handshake_timeout{std::chrono::seconds(45)};
  std::chrono::milliseconds listen_timeout{std::chrono::seconds(60)};
  DialConfig dial;
  ListenConfig listen;
};

// Overlay dialer plus optional framed dialer, built once per transport
struct DialSession {
  OverlayDialerPtr dialer;
  std::unique_ptr<FramedDialer> framed;
};

/**
 * OnionTransport - pluggable transport over the Tor overlay
 *
 * Dial path: codec decode -> ensure_session -> raw dial (framed or direct)
 * -> MultiaddrConnection -> Upgrader. Listen path: marker check -> publish
 * hidden service -> OnionListener -> UpgradedListener.
 *
 * The dial session is created lazily by the first dial and reused for the
 * lifetime of the transport, even after later dial failures. Concurrent first
 * dials serialize on init_mutex_ and only one of them opens the overlay
 * dialer. A failed initialization is not remembered: the next dial tries
 * again. session_mutex_ only guards the session pointer, so close() does not
 * wait for a bootstrapping overlay.
 *
 * Thread-safety: all public methods may be called concurrently.
 */
class OnionTransport : public Transport {
public:
  /**
   * @throws std::invalid_argument on null overlay/upgrader, or websocket mode
   *         without a framing provider
   */
  OnionTransport(OverlayClientPtr overlay, UpgraderPtr upgrader,
                 TransportConfig config = {}, AddressCodec codec = AddressCodec(),
                 FramingProviderPtr framing = nullptr);
  ~OnionTransport() override;

  OnionTransport(const OnionTransport &) = delete;
  OnionTransport &operator=(const OnionTransport &) = delete;

  ConnectionPtr dial(const util::Context &ctx, const Multiaddr &addr,
                     const PeerId &peer, TransportState &state) override;
  ListenerPtr listen(const Multiaddr &addr, TransportState &state) override;
  bool can_dial(const Multiaddr &addr) const override;
  std::vector<Protocol> protocols() const override;
  bool proxy() const override { return true; }

  // Open the dial session if it does not exist yet (idempotent)
  bool ensure_session(const util::Context &ctx, TransportState &state);
  bool has_session() const;

  // Close the overlay dialer; later dials fail with SESSION_INIT_FAILED
  void close();

  const AddressCodec &codec() const { return codec_; }
  const TransportConfig &config() const { return config_; }

private:
  std::shared_ptr<DialSession> current_session() const;

  OverlayClientPtr overlay_;
  UpgraderPtr upgrader_;
  TransportConfig config_;
  AddressCodec codec_;
  FramingProviderPtr framing_;

  // Held for the whole overlay bootstrap
  std::mutex init_mutex_;

  mutable std::mutex session_mutex_;
  std::shared_ptr<DialSession> session_;
  bool closed_ = false; // guarded by session_mutex_
};

} // namespace transport
} // namespace torlink
