// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace topowatch {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * (discovery, resolver, graph, analytics, storage, app).
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
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Only the first call
   * performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "topowatch.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "discovery", "graph", "analytics")
   *
   * Auto-initializes if not initialized. Returns the default logger for
   * unknown component names.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (discovery, resolver, graph, analytics,
   *                  storage, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace topowatch

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  topowatch::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  topowatch::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  topowatch::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  topowatch::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  topowatch::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_DISC_TRACE(...)                                                    \
  topowatch::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...)                                                    \
  topowatch::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...)                                                     \
  topowatch::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...)                                                     \
  topowatch::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...)                                                    \
  topowatch::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

#define LOG_RESOLVER_TRACE(...)                                                \
  topowatch::util::LogManager::GetLogger("resolver")->trace(__VA_ARGS__)
#define LOG_RESOLVER_DEBUG(...)                                                \
  topowatch::util::LogManager::GetLogger("resolver")->debug(__VA_ARGS__)
#define LOG_RESOLVER_WARN(...)                                                 \
  topowatch::util::LogManager::GetLogger("resolver")->warn(__VA_ARGS__)

#define LOG_GRAPH_TRACE(...)                                                   \
  topowatch::util::LogManager::GetLogger("graph")->trace(__VA_ARGS__)
#define LOG_GRAPH_DEBUG(...)                                                   \
  topowatch::util::LogManager::GetLogger("graph")->debug(__VA_ARGS__)
#define LOG_GRAPH_INFO(...)                                                    \
  topowatch::util::LogManager::GetLogger("graph")->info(__VA_ARGS__)
#define LOG_GRAPH_WARN(...)                                                    \
  topowatch::util::LogManager::GetLogger("graph")->warn(__VA_ARGS__)
#define LOG_GRAPH_ERROR(...)                                                   \
  topowatch::util::LogManager::GetLogger("graph")->error(__VA_ARGS__)

#define LOG_ANALYTICS_DEBUG(...)                                               \
  topowatch::util::LogManager::GetLogger("analytics")->debug(__VA_ARGS__)
#define LOG_ANALYTICS_INFO(...)                                                \
  topowatch::util::LogManager::GetLogger("analytics")->info(__VA_ARGS__)

#define LOG_STORAGE_TRACE(...)                                                 \
  topowatch::util::LogManager::GetLogger("storage")->trace(__VA_ARGS__)
#define LOG_STORAGE_INFO(...)                                                  \
  topowatch::util::LogManager::GetLogger("storage")->info(__VA_ARGS__)
#define LOG_STORAGE_WARN(...)                                                  \
  topowatch::util::LogManager::GetLogger("storage")->warn(__VA_ARGS__)
#define LOG_STORAGE_ERROR(...)                                                 \
  topowatch::util::LogManager::GetLogger("storage")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  topowatch::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  topowatch::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  topowatch::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  topowatch::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
