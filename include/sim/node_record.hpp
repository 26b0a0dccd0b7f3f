// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace nodesim {
namespace sim {

// Values are drawn uniformly from [0, MAX_NODE_VALUE)
static constexpr int MAX_NODE_VALUE = 100;

// One entry of the simulated system's state. id and name are fixed at
// creation; value and timestamp change on every update of this node.
struct NodeRecord {
  int id{0};
  std::string name;
  int value{0};
  std::chrono::system_clock::time_point timestamp{};

  bool operator==(const NodeRecord& other) const = default;
};

// Deterministic name for a node id: "Node-<id>"
std::string NodeName(int id);

// Encodes {"id", "name", "value", "time"} in that order.
// time is RFC 3339 UTC (see util::FormatRFC3339).
void to_json(nlohmann::ordered_json& j, const NodeRecord& record);

}  // namespace sim
}  // namespace nodesim
