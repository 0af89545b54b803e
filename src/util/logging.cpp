// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace codl3 {
namespace util {

namespace {

std::mutex g_log_mutex;
bool g_initialized = false;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;

const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

// Assumes g_log_mutex held
void InitializeLocked(const std::string &log_level, bool log_to_file,
                      const std::string &log_file_path) {
  if (g_initialized) {
    return;
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;

    // File sink (append mode)
    if (log_to_file) {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          log_file_path, true);
      file_sink->set_pattern(LOG_PATTERN);
      sinks.push_back(file_sink);
    } else {
      // Console sink for tests (colorized stdout)
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern(LOG_PATTERN);
      sinks.push_back(console_sink);
    }

    for (const auto &component : LogManager::Components()) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::debug);
      spdlog::drop(component);
      spdlog::register_logger(logger);
      g_loggers[component] = logger;
    }

    spdlog::set_default_logger(g_loggers["default"]);
    g_initialized = true;

    // Visual separator for a new session in an appended file
    if (log_to_file) {
      for (int i = 0; i < 10; ++i) {
        g_loggers["default"]->info("");
      }
    }

    g_loggers["default"]->info("Logging system initialized (level: {})",
                               log_level);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

} // namespace

const std::vector<std::string> &LogManager::Components() {
  static const std::vector<std::string> components = {
      "default", "chain", "mining", "staking",
      "bridge",  "network", "rpc",  "app"};
  return components;
}

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  InitializeLocked(log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    return;
  }

  g_loggers["default"]->info("Shutting down logging system");

  spdlog::shutdown();
  g_loggers.clear();
  g_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    // Auto-initialize with defaults if not initialized
    InitializeLocked("info", false, "");
  }

  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }

  auto fallback = g_loggers.find("default");
  if (fallback != g_loggers.end()) {
    return fallback->second;
  }

  // Initialization failed; spdlog always has a default logger
  return spdlog::default_logger();
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : g_loggers) {
    logger->set_level(log_level);
  }

  g_loggers["default"]->info("Log level changed to: {}", level);
}

void LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    return;
  }

  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
    g_loggers["default"]->info("Component '{}' log level set to: {}",
                               component, level);
  } else {
    g_loggers["default"]->warn("Unknown log component: {}", component);
  }
}

} // namespace util
} // namespace codl3
