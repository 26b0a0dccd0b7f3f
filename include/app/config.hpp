// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nodesim {
namespace app {

struct AppConfig {
  uint16_t listen_port = 8080;
  int node_count = 5;
  std::chrono::seconds update_interval{5};
  size_t io_threads = 2;

  std::string log_level = "info";
  bool log_to_file = false;
  std::string log_file = "nodesim.log";
};

enum class CliAction { Run, Help, Version };

struct CliResult {
  CliAction action = CliAction::Run;
  AppConfig config;
  std::string error;  // empty on success

  bool ok() const { return error.empty(); }
};

// Parse --key=value options (args excludes the program name).
// Unknown options and out-of-range values produce an error.
CliResult ParseCommandLine(const std::vector<std::string>& args);

std::string GetUsage(const std::string& program_name);

}  // namespace app
}  // namespace nodesim
