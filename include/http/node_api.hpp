// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "http/http_message.hpp"
#include "sim/node_record.hpp"

#include <vector>

namespace nodesim {

namespace sim {
class NodeStore;
}

namespace http {

static constexpr const char* WELCOME_MESSAGE =
    "Welcome to the Distributed System Simulator! Visit /nodes to get node data.";

// NodeApi - request routing for the simulator's HTTP surface
//
//   /nodes  -> JSON array of the current NodeStore snapshot
//   /*      -> {"message": WELCOME_MESSAGE}
//
// Any method is accepted. Paths match exactly, so "/nodes/" and "/nodesx"
// get the welcome message.
//
// Only reads the store, via NodeStore::Snapshot(). Stateless otherwise, so
// safe to call from any number of io threads.
class NodeApi {
public:
  explicit NodeApi(const sim::NodeStore& store);

  HttpResponse Handle(const HttpRequest& request) const;

  HttpResponse HandleRoot() const;
  HttpResponse HandleNodes() const;

  // JSON array of records; 500 text response if encoding fails
  static HttpResponse EncodeNodes(const std::vector<sim::NodeRecord>& nodes);

private:
  const sim::NodeStore& store_;
};

}  // namespace http
}  // namespace nodesim
