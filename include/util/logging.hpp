// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace torlink {
namespace util {

/**
 * LogManager - process-wide registry of spdlog component loggers
 *
 * Components:
 *   default  general messages
 *   network  transport, listeners, upgrades
 *   tor      tor control port, SOCKS, hidden services
 *   dht      content routing and peer quorum connection
 *   app      node lifecycle
 *
 * Thread-safety: Initialize() runs once (std::call_once). All other methods
 * take the registry mutex. GetLogger() auto-initializes with console output.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum level (trace, debug, info, warn, error, critical, off)
   * @param log_to_file Also write to a rotating file
   * @param log_file_path File path used when log_to_file is set
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "torlink.log");

  // Flush and drop all loggers
  static void Shutdown();

  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set level on every component
  static void SetLogLevel(const std::string &level);

  // Returns false if the component is unknown
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  // True if messages at `level` would be emitted by `component`
  static bool IsEnabled(const std::string &component,
                        spdlog::level::level_enum level);

  static const std::vector<std::string> &ComponentNames();
};

} // namespace util
} // namespace torlink

#define LOG_TRACE(...)                                                         \
  torlink::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  torlink::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  torlink::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  torlink::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  torlink::util::LogManager::GetLogger()->error(__VA_ARGS__)

#define LOG_NET_TRACE(...)                                                     \
  torlink::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  torlink::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  torlink::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  torlink::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  torlink::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_TOR_TRACE(...)                                                     \
  torlink::util::LogManager::GetLogger("tor")->trace(__VA_ARGS__)
#define LOG_TOR_DEBUG(...)                                                     \
  torlink::util::LogManager::GetLogger("tor")->debug(__VA_ARGS__)
#define LOG_TOR_INFO(...)                                                      \
  torlink::util::LogManager::GetLogger("tor")->info(__VA_ARGS__)
#define LOG_TOR_WARN(...)                                                      \
  torlink::util::LogManager::GetLogger("tor")->warn(__VA_ARGS__)
#define LOG_TOR_ERROR(...)                                                     \
  torlink::util::LogManager::GetLogger("tor")->error(__VA_ARGS__)

#define LOG_DHT_TRACE(...)                                                     \
  torlink::util::LogManager::GetLogger("dht")->trace(__VA_ARGS__)
#define LOG_DHT_DEBUG(...)                                                     \
  torlink::util::LogManager::GetLogger("dht")->debug(__VA_ARGS__)
#define LOG_DHT_INFO(...)                                                      \
  torlink::util::LogManager::GetLogger("dht")->info(__VA_ARGS__)
#define LOG_DHT_WARN(...)                                                      \
  torlink::util::LogManager::GetLogger("dht")->warn(__VA_ARGS__)
#define LOG_DHT_ERROR(...)                                                     \
  torlink::util::LogManager::GetLogger("dht")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  torlink::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  torlink::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  torlink::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
