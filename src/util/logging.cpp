// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <array>
#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace nodesim {
namespace util {

namespace {

constexpr std::array<const char*, 4> kComponents = {"default", "http", "sim", "app"};
constexpr size_t kMaxLogFileSize = 10 * 1024 * 1024;  // 10 MB per file
constexpr size_t kMaxLogFiles = 3;

std::once_flag g_init_flag;
std::mutex g_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;

// Settings of the last initialization, reused when loggers are re-created
// after Shutdown(). Guarded by g_mutex.
struct LogSettings {
  std::string level = "info";
  bool to_file = false;
  std::string file_path;
};
LogSettings g_settings;

// Requires g_mutex held.
void CreateLoggers(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  std::string file_error;
  if (log_to_file && !log_file_path.empty()) {
    try {
      sinks.push_back(
          std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file_path, kMaxLogFileSize, kMaxLogFiles));
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  const auto level = spdlog::level::from_str(log_level);
  for (const char* component : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    g_loggers[component] = logger;
  }

  // Console logging still works without the file sink
  if (!file_error.empty()) {
    g_loggers["default"]->warn("cannot open log file {}: {}", log_file_path, file_error);
  }
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::call_once(g_init_flag, [&]() {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_settings = LogSettings{log_level, log_to_file, log_file_path};
    CreateLoggers(log_level, log_to_file, log_file_path);
  });
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  Initialize();

  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_loggers.empty()) {
    // Shut down earlier; come back with the configured level and sinks
    CreateLoggers(g_settings.level, g_settings.to_file, g_settings.file_path);
  }

  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }
  return g_loggers["default"];
}

void LogManager::SetLogLevel(const std::string& level) {
  const auto lvl = spdlog::level::from_str(level);
  std::lock_guard<std::mutex> lock(g_mutex);
  g_settings.level = level;
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(lvl);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  const auto lvl = spdlog::level::from_str(level);
  std::lock_guard<std::mutex> lock(g_mutex);
  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(lvl);
  }
}

bool LogManager::IsValidLevel(const std::string& level) {
  // spdlog::level::from_str maps unknown names to "off", so check "off" explicitly
  if (level == "off") {
    return true;
  }
  return spdlog::level::from_str(level) != spdlog::level::off;
}

}  // namespace util
}  // namespace nodesim
