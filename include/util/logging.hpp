// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace codl3 {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One named logger per node component, all sharing the same sinks.
 *
 * Thread-safety: All methods are thread-safe. Initialization and logger
 * lookup are serialized by one mutex; only the first Initialize() call
 * takes effect.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "chain", "mining", "bridge")
   *
   * Auto-initializes if not initialized. Unknown names fall back to the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component One of Components()
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);

  // Names of all component loggers
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace codl3

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  codl3::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  codl3::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  codl3::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  codl3::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  codl3::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  codl3::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_MINING_TRACE(...)                                                  \
  codl3::util::LogManager::GetLogger("mining")->trace(__VA_ARGS__)
#define LOG_MINING_DEBUG(...)                                                  \
  codl3::util::LogManager::GetLogger("mining")->debug(__VA_ARGS__)
#define LOG_MINING_INFO(...)                                                   \
  codl3::util::LogManager::GetLogger("mining")->info(__VA_ARGS__)
#define LOG_MINING_WARN(...)                                                   \
  codl3::util::LogManager::GetLogger("mining")->warn(__VA_ARGS__)
#define LOG_MINING_ERROR(...)                                                  \
  codl3::util::LogManager::GetLogger("mining")->error(__VA_ARGS__)

#define LOG_STAKE_TRACE(...)                                                   \
  codl3::util::LogManager::GetLogger("staking")->trace(__VA_ARGS__)
#define LOG_STAKE_DEBUG(...)                                                   \
  codl3::util::LogManager::GetLogger("staking")->debug(__VA_ARGS__)
#define LOG_STAKE_INFO(...)                                                    \
  codl3::util::LogManager::GetLogger("staking")->info(__VA_ARGS__)
#define LOG_STAKE_WARN(...)                                                    \
  codl3::util::LogManager::GetLogger("staking")->warn(__VA_ARGS__)
#define LOG_STAKE_ERROR(...)                                                   \
  codl3::util::LogManager::GetLogger("staking")->error(__VA_ARGS__)

#define LOG_BRIDGE_TRACE(...)                                                  \
  codl3::util::LogManager::GetLogger("bridge")->trace(__VA_ARGS__)
#define LOG_BRIDGE_DEBUG(...)                                                  \
  codl3::util::LogManager::GetLogger("bridge")->debug(__VA_ARGS__)
#define LOG_BRIDGE_INFO(...)                                                   \
  codl3::util::LogManager::GetLogger("bridge")->info(__VA_ARGS__)
#define LOG_BRIDGE_WARN(...)                                                   \
  codl3::util::LogManager::GetLogger("bridge")->warn(__VA_ARGS__)
#define LOG_BRIDGE_ERROR(...)                                                  \
  codl3::util::LogManager::GetLogger("bridge")->error(__VA_ARGS__)

#define LOG_NET_TRACE(...)                                                     \
  codl3::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  codl3::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  codl3::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  codl3::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  codl3::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_RPC_TRACE(...)                                                     \
  codl3::util::LogManager::GetLogger("rpc")->trace(__VA_ARGS__)
#define LOG_RPC_DEBUG(...)                                                     \
  codl3::util::LogManager::GetLogger("rpc")->debug(__VA_ARGS__)
#define LOG_RPC_INFO(...)                                                      \
  codl3::util::LogManager::GetLogger("rpc")->info(__VA_ARGS__)
#define LOG_RPC_WARN(...)                                                      \
  codl3::util::LogManager::GetLogger("rpc")->warn(__VA_ARGS__)
#define LOG_RPC_ERROR(...)                                                     \
  codl3::util::LogManager::GetLogger("rpc")->error(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...)                                                   \
  codl3::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  codl3::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  codl3::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  codl3::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  codl3::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_APP_TRACE(...)                                                     \
  codl3::util::LogManager::GetLogger("app")->trace(__VA_ARGS__)
#define LOG_APP_DEBUG(...)                                                     \
  codl3::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  codl3::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  codl3::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  codl3::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
