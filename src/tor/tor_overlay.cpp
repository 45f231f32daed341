// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "tor/tor_overlay.hpp"
#include "tor/socket_connection.hpp"
#include "tor/socks5.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <set>

namespace torlink {
namespace tor {

using transport::make_error_code;
using transport::overlay_errc;

namespace {

constexpr size_t TOR_COOKIE_SIZE = 32;
constexpr std::chrono::seconds DEL_ONION_TIMEOUT{10};

/**
 * Dialer over tor's SOCKS port; every dial opens a fresh SOCKS stream
 */
class TorDialer : public transport::OverlayDialer {
public:
  TorDialer(std::shared_ptr<TorOverlay> owner,
            boost::asio::io_context &io_context, std::string socks_host,
            uint16_t socks_port)
      : owner_(std::move(owner)), io_context_(io_context),
        socks_host_(std::move(socks_host)), socks_port_(socks_port) {}

  transport::RawConnectionPtr dial(const util::Context &ctx,
                                   const std::string &host, uint16_t port,
                                   boost::system::error_code &ec) override {
    if (closed_.load(std::memory_order_acquire) || !owner_->is_running()) {
      ec = make_error_code(overlay_errc::session_closed);
      return nullptr;
    }
    auto conn =
        SocketConnection::Connect(io_context_, ctx, socks_host_, socks_port_, ec);
    if (!conn) {
      LOG_TOR_DEBUG("cannot reach SOCKS port {}:{}: {}", socks_host_,
                    socks_port_, ec.message());
      return nullptr;
    }
    if (!Socks5Connect(*conn, ctx, host, port, ec)) {
      conn->close();
      return nullptr;
    }
    LOG_TOR_TRACE("SOCKS stream open to {}:{}", host, port);
    return conn;
  }

  void close() override { closed_.store(true, std::memory_order_release); }

private:
  std::shared_ptr<TorOverlay> owner_;
  boost::asio::io_context &io_context_;
  std::string socks_host_;
  uint16_t socks_port_;
  std::atomic<bool> closed_{false};
};

/**
 * ADD_ONION registration forwarding to a loopback acceptor
 */
class TorHiddenService : public transport::HiddenService {
public:
  TorHiddenService(std::shared_ptr<TorOverlay> owner,
                   std::shared_ptr<TorControlConnection> control,
                   std::shared_ptr<SocketAcceptor> acceptor,
                   std::string service_id, uint16_t remote_port)
      : owner_(std::move(owner)), control_(std::move(control)),
        acceptor_(std::move(acceptor)), service_id_(std::move(service_id)),
        remote_port_(remote_port) {}

  ~TorHiddenService() override {
    auto ec = close();
    if (ec) {
      LOG_TOR_DEBUG("DEL_ONION {} in destructor: {}", service_id_, ec.message());
    }
  }

  transport::RawConnectionPtr accept(boost::system::error_code &ec) override {
    return acceptor_->accept(ec);
  }

  boost::system::error_code close() override {
    if (closed_.exchange(true)) {
      return {};
    }
    acceptor_->close();

    auto ctx = util::Context::WithTimeout(util::Context(), DEL_ONION_TIMEOUT);
    boost::system::error_code ec;
    TorControlReply reply;
    if (!control_->command(ctx, "DEL_ONION " + service_id_, reply, ec)) {
      return ec;
    }
    if (!reply.ok()) {
      LOG_TOR_WARN("DEL_ONION {} rejected: {} {}", service_id_, reply.code,
                   reply.message());
      return make_error_code(overlay_errc::protocol_error);
    }
    LOG_TOR_DEBUG("removed hidden service {}", service_id_);
    return {};
  }

  std::string local_endpoint() const override {
    return acceptor_->local_endpoint();
  }

  const std::string &service_id() const override { return service_id_; }
  uint16_t remote_port() const override { return remote_port_; }

private:
  std::shared_ptr<TorOverlay> owner_;
  std::shared_ptr<TorControlConnection> control_;
  std::shared_ptr<SocketAcceptor> acceptor_;
  std::string service_id_;
  uint16_t remote_port_;
  std::atomic<bool> closed_{false};
};

} // namespace

bool AuthenticateControl(TorControlConnection &control,
                         const util::Context &ctx, const std::string &password,
                         const std::string &cookie_path,
                         boost::system::error_code &ec) {
  TorControlReply reply;
  if (!control.command(ctx, "PROTOCOLINFO 1", reply, ec)) {
    return false;
  }
  if (!reply.ok()) {
    LOG_TOR_WARN("PROTOCOLINFO failed: {} {}", reply.code, reply.message());
    ec = make_error_code(overlay_errc::protocol_error);
    return false;
  }

  /*
   * 250-PROTOCOLINFO 1
   * 250-AUTH METHODS=COOKIE,SAFECOOKIE COOKIEFILE="/home/x/.tor/control_auth_cookie"
   * 250-VERSION Tor="0.4.8.10"
   * 250 OK
   */
  std::set<std::string> methods;
  std::string cookiefile;
  for (const auto &line : reply.lines) {
    auto l = SplitTorReplyLine(line);
    if (l.first == "AUTH") {
      auto m = ParseTorReplyMapping(l.second);
      auto it = m.find("METHODS");
      if (it != m.end()) {
        for (const auto &method : util::SplitString(it->second, ',')) {
          methods.insert(method);
        }
      }
      if ((it = m.find("COOKIEFILE")) != m.end()) {
        cookiefile = it->second;
      }
    } else if (l.first == "VERSION") {
      auto m = ParseTorReplyMapping(l.second);
      auto it = m.find("Tor");
      if (it != m.end()) {
        LOG_TOR_DEBUG("connected to tor version {}", it->second);
      }
    }
  }

  std::string auth_command;
  if (!password.empty() && methods.count("HASHEDPASSWORD")) {
    LOG_TOR_DEBUG("using HASHEDPASSWORD authentication");
    auth_command = "AUTHENTICATE " + QuoteTorString(password);
  } else if (methods.count("NULL")) {
    LOG_TOR_DEBUG("using NULL authentication");
    auth_command = "AUTHENTICATE";
  } else if (methods.count("COOKIE")) {
    const std::string path = cookie_path.empty() ? cookiefile : cookie_path;
    auto cookie = util::read_file_string(path, TOR_COOKIE_SIZE * 2);
    if (!cookie || cookie->size() != TOR_COOKIE_SIZE) {
      LOG_TOR_WARN("authentication cookie {} could not be read", path);
      ec = make_error_code(overlay_errc::authentication_failed);
      return false;
    }
    LOG_TOR_DEBUG("using COOKIE authentication, reading cookie from {}", path);
    auth_command = "AUTHENTICATE " + util::HexEncode(*cookie);
  } else {
    if (methods.count("HASHEDPASSWORD")) {
      LOG_TOR_WARN("tor requires a control password");
    } else {
      LOG_TOR_WARN("no supported authentication method offered by tor");
    }
    ec = make_error_code(overlay_errc::authentication_failed);
    return false;
  }

  if (!control.command(ctx, auth_command, reply, ec)) {
    return false;
  }
  if (!reply.ok()) {
    LOG_TOR_WARN("authentication failed: {}", reply.message());
    ec = make_error_code(overlay_errc::authentication_failed);
    return false;
  }
  LOG_TOR_DEBUG("control port authenticated");
  return true;
}

bool WaitForBootstrap(TorControlConnection &control, const util::Context &ctx,
                      std::chrono::milliseconds poll_interval,
                      boost::system::error_code &ec) {
  const std::string key = "status/bootstrap-phase=";
  for (;;) {
    TorControlReply reply;
    if (!control.command(ctx, "GETINFO status/bootstrap-phase", reply, ec)) {
      return false;
    }
    if (!reply.ok()) {
      ec = make_error_code(overlay_errc::protocol_error);
      return false;
    }
    std::optional<int> progress;
    for (const auto &line : reply.lines) {
      if (line.rfind(key, 0) == 0) {
        progress = ParseBootstrapProgress(line.substr(key.size()));
      }
    }
    if (progress && *progress == 100) {
      LOG_TOR_DEBUG("tor bootstrap complete");
      return true;
    }
    LOG_TOR_DEBUG("tor bootstrap at {}%", progress.value_or(0));
    if (ctx.WaitFor(poll_interval)) {
      ec = transport::ContextError(ctx);
      return false;
    }
  }
}

bool AddOnion(TorControlConnection &control, const util::Context &ctx,
              uint16_t remote_port, uint16_t local_port, bool version3,
              std::string &service_id, boost::system::error_code &ec) {
  const std::string key_spec = version3 ? "NEW:ED25519-V3" : "NEW:BEST";
  const std::string command = "ADD_ONION " + key_spec +
                              " Flags=DiscardPK Port=" +
                              std::to_string(remote_port) + ",127.0.0.1:" +
                              std::to_string(local_port);
  TorControlReply reply;
  if (!control.command(ctx, command, reply, ec)) {
    return false;
  }
  if (!reply.ok()) {
    LOG_TOR_WARN("ADD_ONION failed: {} {}", reply.code, reply.message());
    ec = make_error_code(overlay_errc::service_unavailable);
    return false;
  }
  for (const auto &line : reply.lines) {
    auto m = ParseTorReplyMapping(line);
    auto it = m.find("ServiceID");
    if (it != m.end()) {
      service_id = it->second;
    }
  }
  if (service_id.empty() || !util::IsBase32Lower(service_id)) {
    LOG_TOR_WARN("ADD_ONION reply carried no usable ServiceID");
    ec = make_error_code(overlay_errc::protocol_error);
    return false;
  }
  return true;
}

bool DiscoverSocksListener(TorControlConnection &control,
                           const util::Context &ctx, std::string &host,
                           uint16_t &port, boost::system::error_code &ec) {
  TorControlReply reply;
  if (!control.command(ctx, "GETINFO net/listeners/socks", reply, ec)) {
    return false;
  }
  if (!reply.ok()) {
    ec = make_error_code(overlay_errc::protocol_error);
    return false;
  }
  const std::string key = "net/listeners/socks=";
  for (const auto &line : reply.lines) {
    if (line.rfind(key, 0) != 0) {
      continue;
    }
    for (auto token : util::SplitString(line.substr(key.size()), ' ')) {
      if (token.size() >= 2 && token.front() == '"' && token.back() == '"') {
        token = token.substr(1, token.size() - 2);
      }
      // Unix socket listeners cannot be dialed over TCP
      if (token.rfind("unix:", 0) == 0) {
        continue;
      }
      if (util::SplitHostPort(token, host, port)) {
        return true;
      }
    }
  }
  LOG_TOR_WARN("tor reports no TCP SOCKS listener");
  ec = make_error_code(overlay_errc::service_unavailable);
  return false;
}

// ============================================================================
// TorOverlay
// ============================================================================

size_t TorOverlay::tracked_services() const {
  std::lock_guard<std::mutex> lock(services_mutex_);
  return services_.size();
}

TorOverlay::TorOverlay(Config config)
    : config_(std::move(config)),
      io_context_(std::make_unique<boost::asio::io_context>()) {}

TorOverlay::~TorOverlay() { stop(); }

void TorOverlay::start() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));
  io_thread_ = std::thread([this]() { io_context_->run(); });
}

void TorOverlay::stop() {
  running_.store(false);

  std::vector<std::weak_ptr<transport::HiddenService>> services;
  {
    std::lock_guard<std::mutex> lock(services_mutex_);
    services.swap(services_);
  }
  for (auto &weak : services) {
    if (auto service = weak.lock()) {
      auto ec = service->close();
      if (ec) {
        LOG_TOR_DEBUG("removing {} on shutdown: {}", service->service_id(),
                      ec.message());
      }
    }
  }
  {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (control_) {
      control_->close();
      control_.reset();
    }
    network_enabled_ = false;
  }

  work_guard_.reset();
  if (io_context_) {
    io_context_->stop();
  }
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

std::shared_ptr<TorControlConnection>
TorOverlay::ensure_control(const util::Context &ctx,
                           boost::system::error_code &ec) {
  std::lock_guard<std::mutex> lock(control_mutex_);
  if (control_ && control_->is_open()) {
    return control_;
  }

  std::string host;
  uint16_t port = 0;
  if (!util::SplitHostPort(config_.control_address, host, port)) {
    LOG_TOR_ERROR("invalid tor control address '{}'", config_.control_address);
    ec = make_error_code(overlay_errc::service_unavailable);
    return nullptr;
  }

  auto cmd_ctx = util::Context::WithTimeout(ctx, config_.command_timeout);
  auto stream = SocketConnection::Connect(*io_context_, cmd_ctx, host, port, ec);
  if (!stream) {
    LOG_TOR_WARN("cannot connect to tor control port {}: {}",
                 config_.control_address, ec.message());
    return nullptr;
  }
  auto control = std::make_shared<TorControlConnection>(stream);
  if (!AuthenticateControl(*control, cmd_ctx, config_.control_password,
                           config_.cookie_path, ec)) {
    control->close();
    return nullptr;
  }
  LOG_TOR_INFO("connected to tor control port {}", config_.control_address);
  control_ = control;
  network_enabled_ = false;
  return control_;
}

bool TorOverlay::enable_network(
    const util::Context &ctx,
    const std::shared_ptr<TorControlConnection> &control,
    boost::system::error_code &ec) {
  std::lock_guard<std::mutex> lock(control_mutex_);
  if (network_enabled_) {
    return true;
  }
  auto cmd_ctx = util::Context::WithTimeout(ctx, config_.command_timeout);
  TorControlReply reply;
  if (!control->command(cmd_ctx, "SETCONF DisableNetwork=0", reply, ec)) {
    return false;
  }
  if (!reply.ok()) {
    LOG_TOR_WARN("SETCONF DisableNetwork=0 failed: {}", reply.message());
    ec = make_error_code(overlay_errc::protocol_error);
    return false;
  }
  if (!WaitForBootstrap(*control, ctx, config_.bootstrap_poll_interval, ec)) {
    return false;
  }
  network_enabled_ = true;
  return true;
}

transport::OverlayDialerPtr
TorOverlay::open_dialer(const util::Context &ctx,
                        const transport::DialConfig &config,
                        boost::system::error_code &ec) {
  if (!is_running()) {
    ec = make_error_code(overlay_errc::service_unavailable);
    return nullptr;
  }
  auto control = ensure_control(ctx, ec);
  if (!control) {
    return nullptr;
  }
  if (!config.skip_enable_network && !enable_network(ctx, control, ec)) {
    return nullptr;
  }

  std::string host;
  uint16_t port = 0;
  const std::string &configured = !config.proxy_address.empty()
                                      ? config.proxy_address
                                      : config_.socks_address;
  if (!configured.empty()) {
    if (!util::SplitHostPort(configured, host, port)) {
      LOG_TOR_ERROR("invalid SOCKS address '{}'", configured);
      ec = make_error_code(overlay_errc::service_unavailable);
      return nullptr;
    }
  } else {
    auto cmd_ctx = util::Context::WithTimeout(ctx, config_.command_timeout);
    if (!DiscoverSocksListener(*control, cmd_ctx, host, port, ec)) {
      return nullptr;
    }
  }
  LOG_TOR_DEBUG("dialing through SOCKS {}:{}", host, port);
  return std::make_shared<TorDialer>(shared_from_this(), *io_context_, host,
                                     port);
}

transport::HiddenServicePtr
TorOverlay::publish(const util::Context &ctx,
                    const transport::ListenConfig &config,
                    boost::system::error_code &ec) {
  if (!is_running()) {
    ec = make_error_code(overlay_errc::service_unavailable);
    return nullptr;
  }
  auto control = ensure_control(ctx, ec);
  if (!control) {
    return nullptr;
  }
  if (!enable_network(ctx, control, ec)) {
    return nullptr;
  }

  auto acceptor = SocketAcceptor::Bind(*io_context_, 0, ec);
  if (!acceptor) {
    return nullptr;
  }
  const uint16_t remote_port =
      config.remote_port != 0 ? config.remote_port : acceptor->port();

  std::string service_id;
  auto cmd_ctx = util::Context::WithTimeout(ctx, config_.command_timeout);
  if (!AddOnion(*control, cmd_ctx, remote_port, acceptor->port(),
                config.version3, service_id, ec)) {
    acceptor->close();
    return nullptr;
  }
  LOG_TOR_INFO("hidden service {}.onion:{} -> 127.0.0.1:{}", service_id,
               remote_port, acceptor->port());

  auto service = std::make_shared<TorHiddenService>(
      shared_from_this(), control, acceptor, service_id, remote_port);
  {
    std::lock_guard<std::mutex> lock(services_mutex_);
    // Services dropped by their owners already sent DEL_ONION
    services_.erase(std::remove_if(services_.begin(), services_.end(),
                                   [](const auto &weak) { return weak.expired(); }),
                    services_.end());
    services_.push_back(service);
  }
  return service;
}

} // namespace tor
} // namespace torlink
