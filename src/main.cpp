// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application.hpp"
#include "app/config.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  using namespace nodesim;

  std::vector<std::string> args(argv + 1, argv + argc);
  app::CliResult cli = app::ParseCommandLine(args);

  if (!cli.ok()) {
    std::cerr << "Error: " << cli.error << "\n\n" << app::GetUsage(argv[0]);
    return 1;
  }
  if (cli.action == app::CliAction::Help) {
    std::cout << app::GetUsage(argv[0]);
    return 0;
  }
  if (cli.action == app::CliAction::Version) {
    std::cout << GetFullVersionString() << std::endl;
    return 0;
  }

  const app::AppConfig& config = cli.config;
  util::LogManager::Initialize(config.log_level, config.log_to_file, config.log_file);

  int exit_code = 0;
  try {
    app::Application application(config);

    if (!application.initialize()) {
      LOG_ERROR("Initialization failed");
      exit_code = 1;
    } else if (!application.start()) {
      // Cannot serve without a listening socket
      LOG_ERROR("Startup failed");
      exit_code = 1;
    } else {
      LOG_INFO("Press Ctrl+C to stop");
      application.wait_for_shutdown();
    }
  } catch (const std::exception& e) {
    LOG_ERROR("Fatal error: {}", e.what());
    exit_code = 1;
  }

  util::LogManager::Shutdown();
  return exit_code;
}
