// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "http/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace nodesim {
namespace http {

namespace {

std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

bool IsToken(std::string_view s) {
  if (s.empty()) {
    return false;
  }
  return std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isalnum(c) || std::string_view("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) != std::string_view::npos;
  });
}

// Splits off one line; accepts CRLF and bare LF terminators
std::optional<std::string_view> NextLine(std::string_view& rest) {
  size_t nl = rest.find('\n');
  if (nl == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view line = rest.substr(0, nl);
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  rest.remove_prefix(nl + 1);
  return line;
}

}  // namespace

std::optional<HttpRequest> ParseRequest(std::string_view head) {
  if (head.size() > MAX_HEADER_BYTES) {
    return std::nullopt;
  }

  std::string_view rest = head;
  auto request_line = NextLine(rest);
  if (!request_line) {
    return std::nullopt;
  }

  // METHOD SP TARGET SP VERSION
  size_t sp1 = request_line->find(' ');
  size_t sp2 = sp1 == std::string_view::npos ? sp1 : request_line->find(' ', sp1 + 1);
  if (sp1 == std::string_view::npos || sp2 == std::string_view::npos ||
      request_line->find(' ', sp2 + 1) != std::string_view::npos) {
    return std::nullopt;
  }

  HttpRequest req;
  req.method = std::string(request_line->substr(0, sp1));
  req.target = std::string(request_line->substr(sp1 + 1, sp2 - sp1 - 1));
  req.version = std::string(request_line->substr(sp2 + 1));

  if (!IsToken(req.method) || req.target.empty() || req.target.front() != '/') {
    return std::nullopt;
  }
  if (req.version != "HTTP/1.1" && req.version != "HTTP/1.0") {
    return std::nullopt;
  }

  size_t query = req.target.find('?');
  req.path = query == std::string::npos ? req.target : req.target.substr(0, query);

  bool terminated = false;
  while (auto line = NextLine(rest)) {
    if (line->empty()) {
      terminated = true;
      break;
    }
    size_t colon = line->find(':');
    if (colon == std::string_view::npos || !IsToken(line->substr(0, colon))) {
      return std::nullopt;
    }
    req.headers[ToLower(line->substr(0, colon))] = std::string(Trim(line->substr(colon + 1)));
  }

  if (!terminated) {
    return std::nullopt;
  }
  return req;
}

HttpResponse HttpResponse::Json(int status, std::string body) {
  HttpResponse resp;
  resp.status = status;
  resp.content_type = "application/json";
  resp.body = std::move(body);
  return resp;
}

HttpResponse HttpResponse::Text(int status, std::string body) {
  HttpResponse resp;
  resp.status = status;
  resp.content_type = "text/plain; charset=utf-8";
  resp.body = std::move(body);
  return resp;
}

std::string HttpResponse::Serialize() const {
  std::string out;
  out.reserve(body.size() + 256);
  out += "HTTP/1.1 " + std::to_string(status) + " " + std::string(StatusText(status)) + "\r\n";
  if (!content_type.empty()) {
    out += "Content-Type: " + content_type + "\r\n";
  }
  out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  out += "Connection: close\r\n";
  out += "\r\n";
  out += body;
  return out;
}

std::string_view StatusText(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 431:
    return "Request Header Fields Too Large";
  case 500:
    return "Internal Server Error";
  default:
    return "Unknown";
  }
}

}  // namespace http
}  // namespace nodesim
