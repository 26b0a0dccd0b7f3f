// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace nodesim {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Owns one logger per component ("default", "http", "sim", "app"), all
 * writing to the same sinks: a colored console sink and, optionally, a
 * rotating file sink.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Only the first call performs initialization; later calls are no-ops.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "nodesim.log");

  // Flush and drop all loggers. Logging after shutdown re-creates them with
  // the level and sinks last configured.
  static void Shutdown();

  // Get logger for a component. Unknown components get the default logger.
  // Auto-initializes if not initialized.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a single component.
  static void SetComponentLevel(const std::string& component, const std::string& level);

  // True if level names one of trace/debug/info/warn/error/critical/off.
  static bool IsValidLevel(const std::string& level);
};

}  // namespace util
}  // namespace nodesim

// Convenience macros for logging
#define LOG_TRACE(...) nodesim::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) nodesim::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) nodesim::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) nodesim::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) nodesim::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_HTTP_TRACE(...) nodesim::util::LogManager::GetLogger("http")->trace(__VA_ARGS__)
#define LOG_HTTP_DEBUG(...) nodesim::util::LogManager::GetLogger("http")->debug(__VA_ARGS__)
#define LOG_HTTP_INFO(...) nodesim::util::LogManager::GetLogger("http")->info(__VA_ARGS__)
#define LOG_HTTP_WARN(...) nodesim::util::LogManager::GetLogger("http")->warn(__VA_ARGS__)
#define LOG_HTTP_ERROR(...) nodesim::util::LogManager::GetLogger("http")->error(__VA_ARGS__)

#define LOG_SIM_TRACE(...) nodesim::util::LogManager::GetLogger("sim")->trace(__VA_ARGS__)
#define LOG_SIM_DEBUG(...) nodesim::util::LogManager::GetLogger("sim")->debug(__VA_ARGS__)
#define LOG_SIM_INFO(...) nodesim::util::LogManager::GetLogger("sim")->info(__VA_ARGS__)
#define LOG_SIM_WARN(...) nodesim::util::LogManager::GetLogger("sim")->warn(__VA_ARGS__)
#define LOG_SIM_ERROR(...) nodesim::util::LogManager::GetLogger("sim")->error(__VA_ARGS__)

#define LOG_APP_INFO(...) nodesim::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...) nodesim::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...) nodesim::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
