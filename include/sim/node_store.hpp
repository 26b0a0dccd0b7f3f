// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "sim/node_record.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <shared_mutex>
#include <vector>

namespace nodesim {
namespace sim {

/**
 * NodeStore - sole owner of the simulated node collection
 *
 * Holds a fixed-size, id-ordered sequence of NodeRecord and the
 * reader/writer lock guarding it. Every reader and writer goes through
 * this class; nothing else touches the records.
 *
 * Locking:
 * - Snapshot(), Size() take shared access and may run concurrently
 * - Initialize(), UpdateRandom() take exclusive access
 * - The RNG is only used under exclusive access
 *
 * Calling Snapshot() or UpdateRandom() before Initialize() is a
 * programming error and throws std::logic_error.
 */
class NodeStore {
public:
  // seed: fixed RNG seed for reproducible runs; random_device otherwise
  explicit NodeStore(std::optional<uint32_t> seed = std::nullopt);

  NodeStore(const NodeStore&) = delete;
  NodeStore& operator=(const NodeStore&) = delete;

  // Replace the collection with count fresh records (ids 0..count-1, random
  // values, current time). Throws std::invalid_argument if count <= 0.
  void Initialize(int count);

  // Point-in-time copy of all records in id order
  std::vector<NodeRecord> Snapshot() const;

  // Rewrite value and timestamp of one uniformly chosen record.
  // Returns the id of the record that changed.
  int UpdateRandom();

  size_t Size() const;
  bool IsInitialized() const;

private:
  int RandomValue();  // requires mutex_ held exclusively

  mutable std::shared_mutex mutex_;
  std::vector<NodeRecord> nodes_;
  std::mt19937 rng_;
};

}  // namespace sim
}  // namespace nodesim
