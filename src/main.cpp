// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <filesystem>
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --conf=<path>          JSON config file (flags given later override it)\n"
      << "  --datadir=<path>       Data directory (default: ~/.torlink)\n"
      << "  --peer-id=<id>         Local peer id (default: generated, kept in <datadir>/peerid)\n"
      << "  --nolisten             Do not publish an onion service\n"
      << "  --onion-port=<port>    Virtual port of the onion service (default: local port)\n"
      << "  --ws                   Frame connections as websocket streams\n"
      << "\n"
      << "Tor:\n"
      << "  --tor-control=<addr>   Control port (default: 127.0.0.1:9051)\n"
      << "  --tor-socks=<addr>     SOCKS port (default: ask tor)\n"
      << "  --tor-password=<pw>    Control port password\n"
      << "  --tor-cookie=<path>    Control auth cookie file\n"
      << "\n"
      << "Peers:\n"
      << "  --peers=<path>         PeerInfo list to connect to on startup\n"
      << "  --min-peers=<n>        Required connections (default: 1)\n"
      << "  --timeout=<secs>       Bound on the startup connection (default: 180)\n"
      << "  --provide=<key>        Announce a content key\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>     Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                         Default: info\n"
      << "  --debug=<component>    Enable trace logging for specific component(s)\n"
      << "                         Components: network, tor, dht, app, all\n"
      << "                         Can be comma-separated: --debug=tor,dht\n"
      << "\n"
      << "Other:\n"
      << "  --version              Show version information\n"
      << "  --help                 Show this help message\n"
      << std::endl;
}

namespace {

bool StartsWith(const std::string &arg, const char *prefix, std::string &value) {
  const std::string p(prefix);
  if (arg.compare(0, p.size(), p) != 0) {
    return false;
  }
  value = arg.substr(p.size());
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    torlink::app::AppConfig config;

    // --conf is applied first so the remaining flags override it
    for (int i = 1; i < argc; ++i) {
      std::string value;
      if (StartsWith(argv[i], "--conf=", value)) {
        std::string error;
        if (!torlink::app::LoadConfigFile(value, config, &error)) {
          std::cerr << "Error: " << error << std::endl;
          return 1;
        }
      }
    }

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      std::string value;

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << torlink::GetFullVersionString() << std::endl;
        std::cout << torlink::GetCopyrightString() << std::endl;
        return 0;
      } else if (StartsWith(arg, "--conf=", value)) {
        // already applied
      } else if (StartsWith(arg, "--datadir=", value)) {
        config.datadir = value;
      } else if (StartsWith(arg, "--peer-id=", value)) {
        config.peer_id = value;
      } else if (arg == "--nolisten") {
        config.listen = false;
      } else if (arg == "--listen") {
        config.listen = true;
      } else if (StartsWith(arg, "--onion-port=", value)) {
        auto port_opt = torlink::util::SafeParsePort(value);
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << value << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.transport.listen.remote_port = *port_opt;
      } else if (arg == "--ws") {
        config.transport.websocket = true;
      } else if (StartsWith(arg, "--tor-control=", value)) {
        config.tor.control_address = value;
      } else if (StartsWith(arg, "--tor-socks=", value)) {
        config.tor.socks_address = value;
      } else if (StartsWith(arg, "--tor-password=", value)) {
        config.tor.control_password = value;
      } else if (StartsWith(arg, "--tor-cookie=", value)) {
        config.tor.cookie_path = value;
      } else if (StartsWith(arg, "--peers=", value)) {
        config.peers_file = value;
      } else if (StartsWith(arg, "--min-peers=", value)) {
        auto n = torlink::util::SafeParseInt(value, 0, 100000);
        if (!n) {
          std::cerr << "Error: Invalid peer count: " << value << std::endl;
          return 1;
        }
        config.min_peers = static_cast<size_t>(*n);
      } else if (StartsWith(arg, "--timeout=", value)) {
        auto secs = torlink::util::SafeParseInt(value, 1, 86400);
        if (!secs) {
          std::cerr << "Error: Invalid timeout: " << value << std::endl;
          std::cerr << "Timeout must be between 1 and 86400 seconds" << std::endl;
          return 1;
        }
        config.connect_timeout = std::chrono::seconds(*secs);
      } else if (StartsWith(arg, "--provide=", value)) {
        config.provide_key = value;
      } else if (StartsWith(arg, "--loglevel=", value)) {
        config.log_level = value;
      } else if (StartsWith(arg, "--debug=", value)) {
        for (const auto &component : torlink::util::SplitString(value, ',')) {
          if (!component.empty()) {
            config.debug_components.push_back(component);
          }
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (!torlink::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory "
                << config.datadir.string() << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "debug.log").string();
    torlink::util::LogManager::Initialize(config.log_level, true, log_file);

    for (const auto &component : config.debug_components) {
      if (component == "all") {
        torlink::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        torlink::util::LogManager::SetComponentLevel("network", "trace");
      } else if (!torlink::util::LogManager::SetComponentLevel(component,
                                                               "trace")) {
        std::cerr << "WARNING: unknown debug component '" << component << "'"
                  << std::endl;
      }
    }

    // Nested scope: the application must be gone before the loggers are
    {
      torlink::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      app.wait_for_shutdown();
    }

    torlink::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Logger may not be safe during exception handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    torlink::util::LogManager::Shutdown();
    return 1;
  }
}
