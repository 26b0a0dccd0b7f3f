// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "http/node_api.hpp"

#include "sim/node_store.hpp"
#include "util/logging.hpp"

#include <nlohmann/json.hpp>

namespace nodesim {
namespace http {

NodeApi::NodeApi(const sim::NodeStore& store) : store_(store) {}

HttpResponse NodeApi::Handle(const HttpRequest& request) const {
  LOG_HTTP_DEBUG("{} {}", request.method, request.target);

  // Method is not checked; every path other than /nodes falls through to /
  if (request.path == "/nodes") {
    return HandleNodes();
  }
  return HandleRoot();
}

HttpResponse NodeApi::HandleRoot() const {
  try {
    nlohmann::json message = {{"message", WELCOME_MESSAGE}};
    return HttpResponse::Json(200, message.dump());
  } catch (const nlohmann::json::exception& e) {
    LOG_HTTP_ERROR("Failed to marshal message: {}", e.what());
    return HttpResponse::Text(500, "Failed to marshal message");
  }
}

HttpResponse NodeApi::HandleNodes() const {
  return EncodeNodes(store_.Snapshot());
}

HttpResponse NodeApi::EncodeNodes(const std::vector<sim::NodeRecord>& nodes) {
  try {
    // ordered_json keeps id, name, value, time in declaration order
    nlohmann::ordered_json body = nodes;
    return HttpResponse::Json(200, body.dump());
  } catch (const nlohmann::json::exception& e) {
    LOG_HTTP_ERROR("Failed to marshal data: {}", e.what());
    return HttpResponse::Text(500, "Failed to marshal data");
  }
}

}  // namespace http
}  // namespace nodesim
