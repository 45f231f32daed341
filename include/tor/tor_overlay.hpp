// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "tor/control_connection.hpp"
#include "transport/overlay.hpp"
#include <atomic>
#include <utility> // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace torlink {
namespace tor {

/**
 * Authenticate a fresh control connection
 *
 * PROTOCOLINFO 1 is queried first. Preference: HASHEDPASSWORD when a password
 * is configured, then NULL, then COOKIE (the cookie file named by tor, or
 * `cookie_path` when set). SAFECOOKIE-only daemons are rejected with
 * overlay_errc::authentication_failed.
 */
bool AuthenticateControl(TorControlConnection &control,
                         const util::Context &ctx, const std::string &password,
                         const std::string &cookie_path,
                         boost::system::error_code &ec);

// Poll status/bootstrap-phase until PROGRESS=100 or `ctx` expires
bool WaitForBootstrap(TorControlConnection &control, const util::Context &ctx,
                      std::chrono::milliseconds poll_interval,
                      boost::system::error_code &ec);

/**
 * ADD_ONION with a new key, forwarding `remote_port` to 127.0.0.1:local_port
 * @param service_id Receives the onion identity (no ".onion")
 */
bool AddOnion(TorControlConnection &control, const util::Context &ctx,
              uint16_t remote_port, uint16_t local_port, bool version3,
              std::string &service_id, boost::system::error_code &ec);

// First SOCKS listener reported by GETINFO net/listeners/socks
bool DiscoverSocksListener(TorControlConnection &control,
                           const util::Context &ctx, std::string &host,
                           uint16_t &port, boost::system::error_code &ec);

/**
 * TorOverlay - OverlayClient backed by a running tor daemon
 *
 * Owns one io_context thread for all sockets (control port, SOCKS streams,
 * hidden service acceptors). The control connection is opened and
 * authenticated on first use and shared by every dialer and service.
 *
 * Usage:
 *   auto tor = std::make_shared<TorOverlay>(config);
 *   tor->start();
 *   auto dialer = tor->open_dialer(ctx, DialConfig{}, ec);
 *   ...
 *   tor->stop();
 */
class TorOverlay : public transport::OverlayClient,
                   public std::enable_shared_from_this<TorOverlay> {
public:
  struct Config {
    std::string control_address = "127.0.0.1:9051";
    // Empty: ask tor with GETINFO net/listeners/socks
    std::string socks_address;
    std::string control_password;
    // Overrides the COOKIEFILE reported by PROTOCOLINFO
    std::string cookie_path;
    std::chrono::milliseconds command_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds bootstrap_poll_interval{
        std::chrono::milliseconds(500)};
  };

  explicit TorOverlay(Config config);
  ~TorOverlay() override;

  TorOverlay(const TorOverlay &) = delete;
  TorOverlay &operator=(const TorOverlay &) = delete;

  // Start the io thread (idempotent)
  void start();

  // Close published services and the control connection, join the io thread
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }

  transport::OverlayDialerPtr open_dialer(const util::Context &ctx,
                                          const transport::DialConfig &config,
                                          boost::system::error_code &ec) override;

  transport::HiddenServicePtr publish(const util::Context &ctx,
                                      const transport::ListenConfig &config,
                                      boost::system::error_code &ec) override;

  const Config &config() const { return config_; }

  // Published services still alive (released ones are pruned on publish)
  size_t tracked_services() const;

private:
  std::shared_ptr<TorControlConnection>
  ensure_control(const util::Context &ctx, boost::system::error_code &ec);
  bool enable_network(const util::Context &ctx,
                      const std::shared_ptr<TorControlConnection> &control,
                      boost::system::error_code &ec);

  Config config_;

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};

  std::mutex control_mutex_;
  std::shared_ptr<TorControlConnection> control_;
  bool network_enabled_ = false; // guarded by control_mutex_

  mutable std::mutex services_mutex_;
  std::vector<std::weak_ptr<transport::HiddenService>> services_;
};

} // namespace tor
} // namespace torlink
