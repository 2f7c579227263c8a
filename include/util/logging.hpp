// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace notekeep {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the application.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "warn",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name ("store", "files", "app", "default")
   *
   * Auto-initializes if not initialized. Unknown names get the default
   * logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @return false if the component is unknown
   */
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  /**
   * Names of the component loggers created at initialization
   */
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace notekeep

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  notekeep::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  notekeep::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  notekeep::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  notekeep::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  notekeep::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_STORE_TRACE(...)                                                   \
  notekeep::util::LogManager::GetLogger("store")->trace(__VA_ARGS__)
#define LOG_STORE_DEBUG(...)                                                   \
  notekeep::util::LogManager::GetLogger("store")->debug(__VA_ARGS__)
#define LOG_STORE_INFO(...)                                                    \
  notekeep::util::LogManager::GetLogger("store")->info(__VA_ARGS__)
#define LOG_STORE_WARN(...)                                                    \
  notekeep::util::LogManager::GetLogger("store")->warn(__VA_ARGS__)
#define LOG_STORE_ERROR(...)                                                   \
  notekeep::util::LogManager::GetLogger("store")->error(__VA_ARGS__)

#define LOG_FILES_DEBUG(...)                                                   \
  notekeep::util::LogManager::GetLogger("files")->debug(__VA_ARGS__)
#define LOG_FILES_WARN(...)                                                    \
  notekeep::util::LogManager::GetLogger("files")->warn(__VA_ARGS__)
#define LOG_FILES_ERROR(...)                                                   \
  notekeep::util::LogManager::GetLogger("files")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  notekeep::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  notekeep::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  notekeep::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  notekeep::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
