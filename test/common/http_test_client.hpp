// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <asio.hpp>

namespace nodesim {
namespace test {

struct RawResponse {
  int status = 0;
  std::map<std::string, std::string> headers;  // names lower-cased
  std::string body;
};

// Send raw bytes to 127.0.0.1:port and read until the server closes.
// Returns nullopt if the connection cannot be made.
inline std::optional<std::string> SendRaw(uint16_t port, const std::string& bytes) {
  asio::io_context io;
  asio::ip::tcp::socket socket(io);
  asio::error_code ec;
  socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), ec);
  if (ec) {
    return std::nullopt;
  }

  asio::write(socket, asio::buffer(bytes), ec);

  std::string out;
  char buf[4096];
  for (;;) {
    size_t n = socket.read_some(asio::buffer(buf), ec);
    out.append(buf, n);
    if (ec) {
      break;
    }
  }
  return out;
}

inline RawResponse ParseRawResponse(const std::string& raw) {
  RawResponse resp;
  size_t head_end = raw.find("\r\n\r\n");
  if (head_end == std::string::npos || raw.compare(0, 9, "HTTP/1.1 ") != 0) {
    return resp;
  }

  resp.status = std::stoi(raw.substr(9, 3));
  resp.body = raw.substr(head_end + 4);

  size_t pos = raw.find("\r\n") + 2;
  while (pos < head_end) {
    size_t eol = raw.find("\r\n", pos);
    std::string line = raw.substr(pos, eol - pos);
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
      std::string name = line.substr(0, colon);
      for (auto& c : name) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      }
      size_t value_start = line.find_first_not_of(' ', colon + 1);
      resp.headers[name] = value_start == std::string::npos ? "" : line.substr(value_start);
    }
    pos = eol + 2;
  }
  return resp;
}

inline RawResponse HttpRequestTo(uint16_t port, const std::string& method, const std::string& target) {
  auto raw = SendRaw(port, method + " " + target + " HTTP/1.1\r\nHost: localhost\r\n\r\n");
  return raw ? ParseRawResponse(*raw) : RawResponse{};
}

inline RawResponse HttpGet(uint16_t port, const std::string& target) {
  return HttpRequestTo(port, "GET", target);
}

}  // namespace test
}  // namespace nodesim
