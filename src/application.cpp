// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "tor/websocket_framing.hpp"
#include "transport/plaintext_upgrader.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <chrono>
#include <cstdio>
#include <iostream>
#include <nlohmann/json.hpp>
#include <random>
#include <thread>
#include <unistd.h> // For write(), STDOUT_FILENO (async-signal-safe)

namespace torlink {
namespace app {

using json = nlohmann::json;

namespace {

bool Fail(std::string *error, const std::string &message) {
  if (error) {
    *error = message;
  }
  return false;
}

template <typename T>
bool ReadField(const json &j, const char *key, T &out, std::string *error) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return true;
  }
  try {
    out = it->get<T>();
  } catch (const json::exception &e) {
    return Fail(error, std::string("invalid value for '") + key +
                           "': " + e.what());
  }
  return true;
}

std::string GeneratePeerId() {
  std::random_device rd;
  std::uniform_int_distribution<int> byte(0, 255);
  std::string id = "tl";
  for (int i = 0; i < 16; ++i) {
    char hex[3];
    std::snprintf(hex, sizeof(hex), "%02x", byte(rd));
    id += hex;
  }
  return id;
}

} // namespace

bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config,
                    std::string *error) {
  auto text = util::read_file_string(path, 1024 * 1024);
  if (!text) {
    return Fail(error, "cannot read config file " + path.string());
  }
  json root = json::parse(*text, nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    return Fail(error, "config file " + path.string() + " is not a JSON object");
  }

  std::string datadir;
  if (!ReadField(root, "datadir", datadir, error)) {
    return false;
  }
  if (!datadir.empty()) {
    config.datadir = datadir;
  }

  auto tor_it = root.find("tor");
  if (tor_it != root.end() && tor_it->is_object()) {
    const json &tor = *tor_it;
    int command_timeout_secs = 0;
    if (!ReadField(tor, "control", config.tor.control_address, error) ||
        !ReadField(tor, "socks", config.tor.socks_address, error) ||
        !ReadField(tor, "password", config.tor.control_password, error) ||
        !ReadField(tor, "cookie", config.tor.cookie_path, error) ||
        !ReadField(tor, "command_timeout_secs", command_timeout_secs, error)) {
      return false;
    }
    if (command_timeout_secs < 0) {
      return Fail(error, "tor.command_timeout_secs must not be negative");
    }
    if (command_timeout_secs > 0) {
      config.tor.command_timeout = std::chrono::seconds(command_timeout_secs);
    }
  }

  int onion_port = config.transport.listen.remote_port;
  int min_peers = static_cast<int>(config.min_peers);
  int64_t connect_timeout_secs = config.connect_timeout.count();
  std::string peers;
  std::vector<std::string> debug;
  if (!ReadField(root, "websocket", config.transport.websocket, error) ||
      !ReadField(root, "listen", config.listen, error) ||
      !ReadField(root, "onion_port", onion_port, error) ||
      !ReadField(root, "peer_id", config.peer_id, error) ||
      !ReadField(root, "peers", peers, error) ||
      !ReadField(root, "min_peers", min_peers, error) ||
      !ReadField(root, "connect_timeout_secs", connect_timeout_secs, error) ||
      !ReadField(root, "provide", config.provide_key, error) ||
      !ReadField(root, "loglevel", config.log_level, error) ||
      !ReadField(root, "debug", debug, error)) {
    return false;
  }

  if (onion_port < 0 || onion_port > 65535) {
    return Fail(error, "onion_port must be between 0 and 65535");
  }
  if (min_peers < 0) {
    return Fail(error, "min_peers must not be negative");
  }
  if (connect_timeout_secs <= 0) {
    return Fail(error, "connect_timeout_secs must be positive");
  }
  config.transport.listen.remote_port = static_cast<uint16_t>(onion_port);
  config.min_peers = static_cast<size_t>(min_peers);
  config.connect_timeout = std::chrono::seconds(connect_timeout_secs);
  if (!peers.empty()) {
    config.peers_file = peers;
  }
  config.debug_components.insert(config.debug_components.end(), debug.begin(),
                                 debug.end());
  return true;
}

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config)
    : config_(config), lifetime_ctx_(util::Context::WithCancel(util::Context())) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  std::cout << GetStartupBanner(config_.transport.websocket ? "websocket"
                                                            : "direct")
            << std::flush;

  LOG_INFO("Initializing torlink...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_identity()) {
    LOG_ERROR("Failed to initialize peer identity");
    return false;
  }

  if (!init_transport()) {
    LOG_ERROR("Failed to initialize transport");
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // One daemon per data directory
  datadir_lock_ = std::make_unique<util::DirectoryLock>(config_.datadir);
  util::LockResult result = datadir_lock_->acquire();
  if (result == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }
  if (result == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "torlinkd is probably already running.",
              config_.datadir.string());
    return false;
  }
  return true;
}

bool Application::init_identity() {
  if (!config_.peer_id.empty()) {
    peer_id_ = config_.peer_id;
  } else {
    const auto id_file = config_.datadir / "peerid";
    auto stored = util::read_file_string(id_file, 1024);
    if (stored) {
      peer_id_ = *stored;
      while (!peer_id_.empty() &&
             (peer_id_.back() == '\n' || peer_id_.back() == '\r')) {
        peer_id_.pop_back();
      }
    }
    if (peer_id_.empty()) {
      peer_id_ = GeneratePeerId();
      if (!util::atomic_write_file(id_file, peer_id_ + "\n", 0600)) {
        LOG_ERROR("Failed to write {}", id_file.string());
        return false;
      }
      LOG_INFO("Generated new peer id");
    }
  }
  if (peer_id_.size() > transport::PlaintextUpgrader::MAX_PEER_ID_LENGTH) {
    LOG_ERROR("Peer id is longer than {} bytes",
              transport::PlaintextUpgrader::MAX_PEER_ID_LENGTH);
    return false;
  }
  LOG_INFO("Peer id: {}", peer_id_);
  return true;
}

bool Application::init_transport() {
  LOG_INFO("Initializing Tor transport (control {})...",
           config_.tor.control_address);

  overlay_ = std::make_shared<tor::TorOverlay>(config_.tor);

  transport::FramingProviderPtr framing;
  if (config_.transport.websocket) {
    framing = std::make_shared<tor::WebSocketFraming>(
        config_.transport.handshake_timeout);
  }

  transport_ = std::make_shared<transport::OnionTransport>(
      overlay_, std::make_shared<transport::PlaintextUpgrader>(peer_id_),
      config_.transport, transport::AddressCodec(), framing);

  host_ = std::make_shared<dht::Host>(peer_id_, transport_);

  std::weak_ptr<dht::Host> weak_host = host_;
  router_ = std::make_shared<dht::LocalContentRouter>([weak_host]() {
    dht::ProviderRecord record;
    if (auto host = weak_host.lock()) {
      record.id = host->id();
      record.addrs = host->listen_addresses();
    }
    return record;
  });

  dht::TorDht::Options options;
  options.websocket = config_.transport.websocket;
  dht_ = std::make_unique<dht::TorDht>(host_, router_,
                                       transport::AddressCodec(), options);
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting torlink...");

  setup_signal_handlers();

  overlay_->start();
  running_ = true;

  if (config_.listen) {
    if (!start_listening()) {
      return false;
    }
    if (!publish_peer_info()) {
      return false;
    }
  } else {
    LOG_INFO("Inbound connections disabled");
  }

  if (!config_.provide_key.empty()) {
    transport::TransportState state;
    auto ctx = util::Context::WithTimeout(lifetime_ctx_, std::chrono::minutes(1));
    if (!dht_->provide(ctx, config_.provide_key, state)) {
      LOG_WARN("Failed to provide '{}': {}", config_.provide_key,
               state.ToString());
    } else {
      LOG_INFO("Providing '{}'", config_.provide_key);
    }
  }

  if (!config_.peers_file.empty()) {
    connect_thread_ = std::make_unique<std::thread>(
        &Application::connect_configured_peers, this);
  }

  LOG_INFO("torlink started successfully");
  LOG_INFO("Press Ctrl+C to stop");
  return true;
}

bool Application::start_listening() {
  LOG_INFO("Publishing onion service (this can take a minute)...");
  transport::TransportState state;
  if (!host_->listen(transport::AddressCodec::listen_marker(), state)) {
    LOG_ERROR("Failed to listen: {}", state.ToString());
    return false;
  }
  for (const auto &addr : host_->listen_addresses()) {
    LOG_INFO("Listening on {}", addr.to_string());
  }
  return true;
}

bool Application::publish_peer_info() {
  transport::TransportState state;
  if (!dht_->apply_peer_info(state)) {
    LOG_ERROR("Failed to derive local peer info: {}", state.ToString());
    return false;
  }
  auto info = dht_->peer_info();
  if (!info) {
    LOG_WARN("No onion listen address, peer info not written");
    return true;
  }
  const auto path = config_.datadir / "peerinfo.json";
  if (!dht::SavePeerInfo(path, *info)) {
    LOG_ERROR("Failed to write {}", path.string());
    return false;
  }
  LOG_INFO("Peer info {} written to {}", info->ToString(), path.string());
  return true;
}

void Application::connect_configured_peers() {
  auto peers = dht::LoadPeerInfos(config_.peers_file);
  if (!peers) {
    LOG_ERROR("Failed to load peers from {}", config_.peers_file.string());
    return;
  }

  std::vector<dht::PeerInfo> candidates;
  for (auto &peer : *peers) {
    if (peer.id != peer_id_) {
      candidates.push_back(std::move(peer));
    }
  }
  LOG_INFO("Connecting to at least {} of {} peers", config_.min_peers,
           candidates.size());

  auto ctx = util::Context::WithTimeout(lifetime_ctx_, config_.connect_timeout);
  transport::TransportState state;
  auto result = dht_->connect_peers(ctx, candidates, config_.min_peers, state);
  if (result.ok()) {
    LOG_INFO("Connected to {} peers (required {})",
             dht_->host().connection_count(), result.required);
  } else {
    LOG_ERROR("Peer connection {}: {}",
              dht::QuorumOutcomeAsString(result.outcome), state.ToString());
  }
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down torlink...");
  running_ = false;

  // Unblock the startup connection before tearing down its collaborators
  lifetime_ctx_.Cancel();
  if (connect_thread_ && connect_thread_->joinable()) {
    LOG_DEBUG("Waiting for peer connection thread");
    connect_thread_->join();
    connect_thread_.reset();
  }

  if (dht_) {
    LOG_INFO("Closing DHT...");
    transport::TransportState state;
    if (!dht_->close(state)) {
      LOG_ERROR("Failed to close DHT: {}", state.ToString());
    }
  }

  if (transport_) {
    transport_->close();
  }

  if (overlay_) {
    LOG_INFO("Stopping Tor overlay...");
    overlay_->stop();
  }

  if (datadir_lock_) {
    datadir_lock_->release();
  }

  LOG_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // write() is async-signal-safe, std::cout is not
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17);
    (void)written;
    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace torlink
