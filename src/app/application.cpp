// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application.hpp"

#include "http/http_server.hpp"
#include "http/node_api.hpp"
#include "sim/node_store.hpp"
#include "sim/update_loop.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <chrono>
#include <iostream>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace nodesim {
namespace app {

// Static instance for signal handling
Application* Application::instance_ = nullptr;

Application::Application(const AppConfig& config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

bool Application::initialize() {
  LOG_APP_INFO("Initializing {}...", GetFullVersionString());

  if (config_.node_count <= 0) {
    LOG_APP_ERROR("Node count must be positive (got {})", config_.node_count);
    return false;
  }
  if (config_.io_threads == 0) {
    LOG_APP_ERROR("At least one IO thread is required");
    return false;
  }

  node_store_ = std::make_unique<sim::NodeStore>();
  node_store_->Initialize(config_.node_count);
  LOG_APP_INFO("Initialized {} nodes", node_store_->Size());

  update_loop_ = std::make_unique<sim::UpdateLoop>(io_context_, *node_store_, config_.update_interval);
  node_api_ = std::make_unique<http::NodeApi>(*node_store_);
  http_server_ = std::make_unique<http::HttpServer>(io_context_, *node_api_);

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }
  if (!http_server_) {
    LOG_APP_ERROR("Application not initialized");
    return false;
  }

  // Bind before spawning anything so a failure leaves nothing to tear down
  if (!http_server_->Start(config_.listen_port)) {
    LOG_APP_ERROR("Failed to start HTTP server on port {}", config_.listen_port);
    return false;
  }

  setup_signal_handlers();

  work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(io_context_));
  for (size_t i = 0; i < config_.io_threads; ++i) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }

  update_loop_->start();
  running_ = true;

  std::cout << GetStartupBanner(config_.node_count, http_server_->listening_port()) << std::flush;
  LOG_APP_INFO("Started: {} nodes, update every {} s, {} IO threads", config_.node_count,
               config_.update_interval.count(), config_.io_threads);
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

uint16_t Application::listening_port() const {
  return http_server_ ? http_server_->listening_port() : 0;
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_APP_INFO("Shutting down...");

  // 1. Stop accepting connections
  http_server_->Stop();

  // 2. Cancel the update timer; no update starts after this returns
  update_loop_->stop();

  // 3. Let the io threads drain and exit
  work_guard_.reset();
  io_context_.stop();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  LOG_APP_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // Ignore SIGPIPE so a client hanging up mid-write cannot kill the process
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    static const char msg[] = "\nReceived signal\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);

    instance_->shutdown_requested_ = true;
  }
}

}  // namespace app
}  // namespace nodesim
