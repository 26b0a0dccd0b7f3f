// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "http/http_server.hpp"

#include "http/http_message.hpp"
#include "http/node_api.hpp"
#include "util/logging.hpp"

#include <exception>
#include <string>

namespace nodesim {
namespace http {

namespace {

// One request/response exchange on an accepted socket. The socket's
// executor is a strand; all handlers below run on it.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(asio::ip::tcp::socket socket, const NodeApi& api, std::chrono::steady_clock::duration read_timeout)
      : socket_(std::move(socket)), deadline_(socket_.get_executor()), buffer_(MAX_HEADER_BYTES), api_(api),
        read_timeout_(read_timeout) {}

  void start() {
    asio::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? "unknown" : ep.address().to_string() + ":" + std::to_string(ep.port());

    deadline_.expires_after(read_timeout_);
    deadline_.async_wait([self = shared_from_this()](const asio::error_code& wait_ec) {
      if (!wait_ec) {
        self->on_timeout();
      }
    });

    asio::async_read_until(socket_, buffer_, "\r\n\r\n",
                           [self = shared_from_this()](const asio::error_code& read_ec, size_t bytes) {
                             self->on_read(read_ec, bytes);
                           });
  }

private:
  void on_timeout() {
    LOG_HTTP_DEBUG("closing {}: no request within {} s", remote_,
                   std::chrono::duration_cast<std::chrono::seconds>(read_timeout_).count());
    close();
  }

  void on_read(const asio::error_code& ec, size_t bytes) {
    if (ec == asio::error::not_found) {
      // streambuf hit its max_size before the blank line
      respond(HttpResponse::Text(431, "Request Header Fields Too Large"));
      return;
    }
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        LOG_HTTP_TRACE("read from {} failed: {}", remote_, ec.message());
      }
      close();
      return;
    }

    auto data = buffer_.data();
    std::string head(asio::buffers_begin(data), asio::buffers_begin(data) + static_cast<std::ptrdiff_t>(bytes));

    HttpResponse response;
    try {
      auto request = ParseRequest(head);
      if (request) {
        response = api_.Handle(*request);
      } else {
        LOG_HTTP_DEBUG("malformed request from {}", remote_);
        response = HttpResponse::Text(400, "Bad Request");
      }
    } catch (const std::exception& e) {
      LOG_HTTP_ERROR("request from {} failed: {}", remote_, e.what());
      response = HttpResponse::Text(500, "Internal Server Error");
    }
    respond(response);
  }

  void respond(const HttpResponse& response) {
    deadline_.cancel();
    wire_ = response.Serialize();
    asio::async_write(socket_, asio::buffer(wire_),
                      [self = shared_from_this(), status = response.status](const asio::error_code& ec, size_t) {
                        if (ec) {
                          LOG_HTTP_DEBUG("failed to write {} response to {}: {}", status, self->remote_,
                                         ec.message());
                        }
                        self->close();
                      });
  }

  void close() {
    asio::error_code ignored;
    deadline_.cancel();
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  asio::ip::tcp::socket socket_;
  asio::steady_timer deadline_;
  asio::streambuf buffer_;
  std::string wire_;  // outgoing bytes; must outlive async_write
  std::string remote_;
  const NodeApi& api_;
  const std::chrono::steady_clock::duration read_timeout_;
};

}  // namespace

HttpServer::HttpServer(asio::io_context& io_context, const NodeApi& api,
                       std::chrono::steady_clock::duration read_timeout)
    : io_context_(io_context), api_(api), read_timeout_(read_timeout) {}

HttpServer::~HttpServer() {
  Stop();
}

bool HttpServer::Start(uint16_t port) {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (acceptor_) {
    LOG_HTTP_WARN("HTTP server already listening on port {}", listening_port());
    return false;
  }

  try {
    using tcp = asio::ip::tcp;
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);

    // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), port));
      acceptor_->listen(asio::socket_base::max_listen_connections);
    } catch (const std::exception&) {
      asio::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), port));
      acceptor_->listen(asio::socket_base::max_listen_connections);
    }

    asio::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    listening_port_.store(ec ? 0 : ep.port(), std::memory_order_release);
  } catch (const std::exception& e) {
    LOG_HTTP_ERROR("failed to listen on port {}: {}", port, e.what());
    if (acceptor_) {
      asio::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    return false;
  }

  running_.store(true, std::memory_order_release);
  LOG_HTTP_INFO("HTTP server listening on port {}", listening_port());
  start_accept();
  return true;
}

void HttpServer::Stop() {
  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (!acceptor_) {
    return;
  }

  running_.store(false, std::memory_order_release);
  asio::error_code ec;
  acceptor_->close(ec);
  acceptor_.reset();
  listening_port_.store(0, std::memory_order_release);
  LOG_HTTP_INFO("HTTP server stopped");
}

void HttpServer::start_accept() {
  // Each connection gets its own strand
  acceptor_->async_accept(asio::make_strand(io_context_),
                          [this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
                            // Aborted: Stop() closed the acceptor; do not touch this
                            if (ec == asio::error::operation_aborted) {
                              return;
                            }
                            handle_accept(ec, std::move(socket));
                          });
}

void HttpServer::handle_accept(const asio::error_code& ec, asio::ip::tcp::socket socket) {
  if (ec) {
    LOG_HTTP_TRACE("accept error: {}", ec.message());
  } else {
    // Start on the session's strand, not on the acceptor's thread
    auto executor = socket.get_executor();
    auto session = std::make_shared<HttpSession>(std::move(socket), api_, read_timeout_);
    asio::post(executor, [session]() { session->start(); });
  }

  std::lock_guard<std::mutex> lock(acceptor_mutex_);
  if (acceptor_ && acceptor_->is_open()) {
    start_accept();
  }
}

}  // namespace http
}  // namespace nodesim
