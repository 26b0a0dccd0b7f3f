// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include <asio.hpp>

namespace nodesim {
namespace http {

class NodeApi;

// Requests must deliver their full header block within this time
static constexpr std::chrono::seconds DEFAULT_READ_TIMEOUT{30};

// HttpServer - minimal HTTP/1.1 front end for NodeApi
//
// One request per connection. Each accepted socket runs on its own strand,
// so a session's read, write and timeout handlers never overlap even with
// several io threads.
//
// Uses an external io_context; the caller runs it. The io_context must stop
// running handlers before this object is destroyed.
class HttpServer {
public:
  HttpServer(asio::io_context& io_context, const NodeApi& api,
             std::chrono::steady_clock::duration read_timeout = DEFAULT_READ_TIMEOUT);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Bind and listen on port (0 = ephemeral), dual-stack when available.
  // Returns false if the socket cannot be bound.
  bool Start(uint16_t port);

  // Close the listener. In-flight sessions finish on their own.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Bound listening port (0 if not listening)
  uint16_t listening_port() const { return listening_port_.load(std::memory_order_acquire); }

private:
  void start_accept();  // requires acceptor_mutex_ held
  void handle_accept(const asio::error_code& ec, asio::ip::tcp::socket socket);

  asio::io_context& io_context_;
  const NodeApi& api_;
  const std::chrono::steady_clock::duration read_timeout_;

  // Serializes acceptor_ between the accept handler (re-arm) and Stop()
  std::mutex acceptor_mutex_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;

  std::atomic<bool> running_{false};
  std::atomic<uint16_t> listening_port_{0};
};

}  // namespace http
}  // namespace nodesim
