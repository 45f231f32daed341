// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include "dht/content_router.hpp"
#include "dht/host.hpp"
#include "dht/peer_info.hpp"
#include "dht/tor_dht.hpp"
#include "tor/tor_overlay.hpp"
#include "transport/onion_transport.hpp"
#include "util/context.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace torlink {
namespace app {

// Application configuration
struct AppConfig {
  std::filesystem::path datadir;

  // Tor daemon endpoints and authentication
  tor::TorOverlay::Config tor;

  // Websocket mode, timeouts, hidden service port
  transport::TransportConfig transport;

  // Publish a hidden service and accept inbound peers
  bool listen = true;

  // Empty = load or create <datadir>/peerid
  std::string peer_id;

  // PeerInfo list to connect to on startup (empty = none)
  std::filesystem::path peers_file;
  size_t min_peers = 1;
  std::chrono::seconds connect_timeout{std::chrono::minutes(3)};

  // Announce this content key once the node is up
  std::string provide_key;

  // Logging
  std::string log_level = "info";
  std::vector<std::string> debug_components;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

/**
 * Apply a JSON config file on top of `config`
 *
 *   {
 *     "datadir": "/var/lib/torlink",
 *     "tor": {"control": "127.0.0.1:9051", "socks": "", "password": "",
 *             "cookie": "", "command_timeout_secs": 30},
 *     "websocket": false,
 *     "listen": true,
 *     "onion_port": 0,
 *     "peer_id": "",
 *     "peers": "peers.json",
 *     "min_peers": 1,
 *     "connect_timeout_secs": 180,
 *     "provide": "",
 *     "loglevel": "info",
 *     "debug": ["dht", "tor"]
 *   }
 *
 * Unknown keys are ignored. Returns false (with `error`) on unreadable or
 * malformed files and on out-of-range values.
 */
bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config,
                    std::string *error = nullptr);

// Application - Main application coordinator
// Starts the Tor overlay, publishes the local PeerInfo, connects to the
// configured peers and tears everything down in reverse order on shutdown.
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  dht::TorDht &dht() { return *dht_; }
  const transport::PeerId &peer_id() const { return peer_id_; }

  // Status
  bool is_running() const { return running_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  transport::PeerId peer_id_;
  std::unique_ptr<util::DirectoryLock> datadir_lock_;

  // Components (initialized in order)
  std::shared_ptr<tor::TorOverlay> overlay_;
  std::shared_ptr<transport::OnionTransport> transport_;
  std::shared_ptr<dht::Host> host_;
  std::shared_ptr<dht::LocalContentRouter> router_;
  std::unique_ptr<dht::TorDht> dht_;

  // Cancelled on shutdown; bounds the startup peer connection
  util::Context lifetime_ctx_;
  std::unique_ptr<std::thread> connect_thread_;

  // Initialization steps
  bool init_datadir();
  bool init_identity();
  bool init_transport();

  // Startup steps
  bool start_listening();
  bool publish_peer_info();
  void connect_configured_peers();

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace torlink
