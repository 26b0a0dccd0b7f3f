// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace nodesim {
namespace http {

// Upper bound for the request line plus header block
static constexpr size_t MAX_HEADER_BYTES = 16 * 1024;

// Parsed HTTP/1.x request head. Bodies are never read: no route accepts one.
struct HttpRequest {
  std::string method;
  std::string target;   // as sent, e.g. "/nodes?x=1"
  std::string path;     // target without query string
  std::string version;  // "HTTP/1.1"
  std::map<std::string, std::string> headers;  // names lower-cased, values trimmed
};

// Parse the request line and headers (everything up to and including the
// blank line). Returns nullopt if the head is malformed.
std::optional<HttpRequest> ParseRequest(std::string_view head);

struct HttpResponse {
  int status{200};
  std::string content_type;
  std::string body;

  static HttpResponse Json(int status, std::string body);
  static HttpResponse Text(int status, std::string body);

  // Status line, Content-Type, Content-Length, Connection: close, body
  std::string Serialize() const;
};

// Reason phrase for the status codes this server emits
std::string_view StatusText(int status);

}  // namespace http
}  // namespace nodesim
