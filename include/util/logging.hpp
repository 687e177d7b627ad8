// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace parley {
namespace util {

/**
 * Central spdlog wrapper.
 *
 * One logger per component ("default", "network", "auth", "call", "app"),
 * all sharing the same sinks. Every method is thread-safe; initialization
 * happens exactly once through std::call_once and GetLogger()
 * auto-initializes with console output when nobody called Initialize().
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum level (trace, debug, info, warn, error, critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path of the log file
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /** Flush and drop all loggers. */
  static void Shutdown();

  /**
   * Logger for a component. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /** Set the level of every component logger. */
  static void SetLogLevel(const std::string &level);

  /**
   * Set the level of one component
   * @return false if the component is unknown
   */
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace parley

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  parley::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  parley::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  parley::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  parley::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  parley::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  parley::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  parley::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  parley::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  parley::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  parley::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_AUTH_DEBUG(...)                                                    \
  parley::util::LogManager::GetLogger("auth")->debug(__VA_ARGS__)
#define LOG_AUTH_INFO(...)                                                     \
  parley::util::LogManager::GetLogger("auth")->info(__VA_ARGS__)
#define LOG_AUTH_WARN(...)                                                     \
  parley::util::LogManager::GetLogger("auth")->warn(__VA_ARGS__)
#define LOG_AUTH_ERROR(...)                                                    \
  parley::util::LogManager::GetLogger("auth")->error(__VA_ARGS__)

#define LOG_CALL_TRACE(...)                                                    \
  parley::util::LogManager::GetLogger("call")->trace(__VA_ARGS__)
#define LOG_CALL_DEBUG(...)                                                    \
  parley::util::LogManager::GetLogger("call")->debug(__VA_ARGS__)
#define LOG_CALL_INFO(...)                                                     \
  parley::util::LogManager::GetLogger("call")->info(__VA_ARGS__)
#define LOG_CALL_WARN(...)                                                     \
  parley::util::LogManager::GetLogger("call")->warn(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  parley::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  parley::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  parley::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
