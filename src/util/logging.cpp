// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace torlink {
namespace util {

namespace {

constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
constexpr size_t kMaxLogFileBytes = 10 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

std::once_flag s_init_flag;

// Guards s_loggers (all reads and writes)
std::mutex s_loggers_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

std::vector<spdlog::sink_ptr> MakeSinks(bool log_to_file,
                                        const std::string &log_file_path) {
  std::vector<spdlog::sink_ptr> sinks;
  if (log_to_file) {
    namespace fs = std::filesystem;
    try {
      fs::path p = log_file_path.empty() ? fs::path("torlink.log")
                                         : fs::path(log_file_path);
      if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
      }
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          p.string(), kMaxLogFileBytes, kMaxLogFiles);
      file_sink->set_pattern(kPattern);
      sinks.push_back(file_sink);
      return sinks;
    } catch (const spdlog::spdlog_ex &ex) {
      std::cerr << "Failed to open log file (" << ex.what()
                << "), logging to console\n";
    }
  }
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_pattern(kPattern);
  sinks.push_back(console_sink);
  return sinks;
}

void InitializeInternal(const std::string &log_level, bool log_to_file,
                        const std::string &log_file_path) {
  try {
    auto sinks = MakeSinks(log_to_file, log_file_path);
    const auto level = spdlog::level::from_str(log_level);

    std::lock_guard<std::mutex> lock(s_loggers_mutex);
    for (const auto &component : LogManager::ComponentNames()) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(level);
      logger->flush_on(spdlog::level::warn);
      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }
    spdlog::set_default_logger(s_loggers["default"]);

    if (level != spdlog::level::off) {
      s_loggers["default"]->info("Logging initialized (level: {})", log_level);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

} // namespace

const std::vector<std::string> &LogManager::ComponentNames() {
  static const std::vector<std::string> names = {"default", "network", "tor",
                                                 "dht", "app"};
  return names;
}

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::call_once(s_init_flag, InitializeInternal, log_level, log_to_file,
                 log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  for (auto &[name, logger] : s_loggers) {
    logger->flush();
  }
  spdlog::shutdown();
  s_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  // After Shutdown() (or a failed init) hand out a silent logger so that
  // late callbacks can still log without crashing.
  if (s_loggers.empty()) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("default", sink);
    logger->set_level(spdlog::level::off);
    s_loggers["default"] = logger;
    return logger;
  }
  return s_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  const auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }
}

bool LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  auto it = s_loggers.find(component);
  if (it == s_loggers.end()) {
    return false;
  }
  it->second->set_level(spdlog::level::from_str(level));
  return true;
}

bool LogManager::IsEnabled(const std::string &component,
                           spdlog::level::level_enum level) {
  auto logger = GetLogger(component);
  return logger && logger->should_log(level);
}

} // namespace util
} // namespace torlink
