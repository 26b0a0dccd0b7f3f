// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/node_store.hpp"

#include "util/time.hpp"

#include <mutex>
#include <stdexcept>

namespace nodesim {
namespace sim {

NodeStore::NodeStore(std::optional<uint32_t> seed) : rng_(seed ? *seed : std::random_device{}()) {}

void NodeStore::Initialize(int count) {
  if (count <= 0) {
    throw std::invalid_argument("NodeStore::Initialize: count must be positive, got " + std::to_string(count));
  }

  std::unique_lock lock(mutex_);

  std::vector<NodeRecord> fresh;
  fresh.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    fresh.push_back(NodeRecord{i, NodeName(i), RandomValue(), util::GetTimePoint()});
  }
  nodes_ = std::move(fresh);
}

std::vector<NodeRecord> NodeStore::Snapshot() const {
  std::shared_lock lock(mutex_);
  if (nodes_.empty()) {
    throw std::logic_error("NodeStore::Snapshot called before Initialize");
  }
  return nodes_;
}

int NodeStore::UpdateRandom() {
  std::unique_lock lock(mutex_);
  if (nodes_.empty()) {
    throw std::logic_error("NodeStore::UpdateRandom called before Initialize");
  }

  std::uniform_int_distribution<size_t> pick(0, nodes_.size() - 1);
  NodeRecord& node = nodes_[pick(rng_)];
  node.value = RandomValue();
  node.timestamp = util::GetTimePoint();
  return node.id;
}

size_t NodeStore::Size() const {
  std::shared_lock lock(mutex_);
  return nodes_.size();
}

bool NodeStore::IsInitialized() const {
  std::shared_lock lock(mutex_);
  return !nodes_.empty();
}

int NodeStore::RandomValue() {
  std::uniform_int_distribution<int> dist(0, MAX_NODE_VALUE - 1);
  return dist(rng_);
}

}  // namespace sim
}  // namespace nodesim
