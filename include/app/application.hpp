// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "app/config.hpp"

#include <atomic>
#include <csignal>
#include <memory>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

namespace nodesim {

namespace http {
class HttpServer;
class NodeApi;
}  // namespace http

namespace sim {
class NodeStore;
class UpdateLoop;
}  // namespace sim

namespace app {

// Application - owns every component and runs startup/shutdown
//
// Component graph:
//   NodeStore  <- UpdateLoop (writes, on a timer)
//              <- NodeApi <- HttpServer (reads, per request)
// All asynchronous work runs on one io_context served by io_threads.
//
// Shutdown order: HttpServer (no new connections), UpdateLoop (no new
// updates), io_context (drains and joins threads). Components are destroyed
// only after the io threads have exited.
class Application {
public:
  explicit Application(const AppConfig& config);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  // Create and populate the store, build the HTTP and update components
  bool initialize();

  // Bind the listener and start the io threads and the update loop.
  // Returns false if the port cannot be bound.
  bool start();

  // Stop everything (idempotent)
  void stop();

  // Block until a signal or request_shutdown(), then shut down
  void wait_for_shutdown();

  void request_shutdown() { shutdown_requested_ = true; }

  bool is_running() const { return running_; }

  sim::NodeStore& node_store() { return *node_store_; }
  sim::UpdateLoop& update_loop() { return *update_loop_; }
  uint16_t listening_port() const;

private:
  void shutdown();
  void setup_signal_handlers();
  static void signal_handler(int signal);

  AppConfig config_;

  // Declared before the components so it outlives their timers and sockets
  asio::io_context io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> io_threads_;

  std::unique_ptr<sim::NodeStore> node_store_;
  std::unique_ptr<sim::UpdateLoop> update_loop_;
  std::unique_ptr<http::NodeApi> node_api_;
  std::unique_ptr<http::HttpServer> http_server_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  static Application* instance_;
};

}  // namespace app
}  // namespace nodesim
