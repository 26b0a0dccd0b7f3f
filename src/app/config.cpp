// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/config.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <sstream>

namespace nodesim {
namespace app {

namespace {

constexpr int MAX_NODE_COUNT = 1000000;
constexpr int MAX_INTERVAL_SECONDS = 86400;
constexpr int MAX_IO_THREADS = 64;

}  // namespace

CliResult ParseCommandLine(const std::vector<std::string>& args) {
  CliResult result;
  AppConfig& config = result.config;

  for (const std::string& arg : args) {
    if (arg == "--help" || arg == "-h") {
      result.action = CliAction::Help;
      return result;
    } else if (arg == "--version" || arg == "-v") {
      result.action = CliAction::Version;
      return result;
    } else if (arg.starts_with("--port=")) {
      auto port = util::SafeParsePort(arg.substr(7));
      if (!port) {
        result.error = "Invalid --port (expected 1-65535): " + arg.substr(7);
        return result;
      }
      config.listen_port = *port;
    } else if (arg.starts_with("--nodes=")) {
      auto nodes = util::SafeParseInt(arg.substr(8), 1, MAX_NODE_COUNT);
      if (!nodes) {
        result.error = "Invalid --nodes (expected 1-" + std::to_string(MAX_NODE_COUNT) + "): " + arg.substr(8);
        return result;
      }
      config.node_count = *nodes;
    } else if (arg.starts_with("--interval=")) {
      auto seconds = util::SafeParseInt(arg.substr(11), 1, MAX_INTERVAL_SECONDS);
      if (!seconds) {
        result.error = "Invalid --interval (expected 1-" + std::to_string(MAX_INTERVAL_SECONDS) +
                       " seconds): " + arg.substr(11);
        return result;
      }
      config.update_interval = std::chrono::seconds(*seconds);
    } else if (arg.starts_with("--threads=")) {
      auto threads = util::SafeParseInt(arg.substr(10), 1, MAX_IO_THREADS);
      if (!threads) {
        result.error = "Invalid --threads (expected 1-" + std::to_string(MAX_IO_THREADS) + "): " + arg.substr(10);
        return result;
      }
      config.io_threads = static_cast<size_t>(*threads);
    } else if (arg.starts_with("--loglevel=")) {
      std::string level = arg.substr(11);
      if (!util::LogManager::IsValidLevel(level)) {
        result.error = "Invalid --loglevel: " + level;
        return result;
      }
      config.log_level = level;
    } else if (arg.starts_with("--logfile=")) {
      config.log_file = arg.substr(10);
      if (config.log_file.empty()) {
        result.error = "--logfile requires a non-empty path";
        return result;
      }
      config.log_to_file = true;
    } else {
      result.error = "Unknown option: " + arg;
      return result;
    }
  }

  return result;
}

std::string GetUsage(const std::string& program_name) {
  std::ostringstream oss;
  oss << "Distributed System Simulator - in-memory node state over HTTP\n\n"
      << "Usage: " << program_name << " [options]\n\n"
      << "Options:\n"
      << "  --port=<port>          HTTP listen port (default: 8080)\n"
      << "  --nodes=<count>        Number of simulated nodes (default: 5)\n"
      << "  --interval=<seconds>   Seconds between random node updates (default: 5)\n"
      << "  --threads=<count>      IO threads serving HTTP and timers (default: 2)\n"
      << "  --loglevel=<level>     trace, debug, info, warn, error, critical, off (default: info)\n"
      << "  --logfile=<path>       Also write logs to a rotating file\n"
      << "  --version              Show version information\n"
      << "  --help                 Show this help message\n";
  return oss.str();
}

}  // namespace app
}  // namespace nodesim
