// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/node_record.hpp"

#include "util/time.hpp"

namespace nodesim {
namespace sim {

std::string NodeName(int id) {
  return "Node-" + std::to_string(id);
}

void to_json(nlohmann::ordered_json& j, const NodeRecord& record) {
  j = nlohmann::ordered_json{
      {"id", record.id},
      {"name", record.name},
      {"value", record.value},
      {"time", util::FormatRFC3339(record.timestamp)},
  };
}

}  // namespace sim
}  // namespace nodesim
