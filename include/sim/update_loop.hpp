// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace nodesim {
namespace sim {

class NodeStore;

static constexpr std::chrono::seconds DEFAULT_UPDATE_INTERVAL{5};

// UpdateLoop - periodic background mutation of a NodeStore
//
// Every interval, calls NodeStore::UpdateRandom() once. The first firing
// happens one full interval after start(); there is no update on startup.
//
// Scheduling is fixed-delay: the next deadline is armed after the current
// firing finishes, so firings are at least `interval` apart. A slow firing
// delays the next one; ticks are never skipped or coalesced.
//
// Runs on an external io_context; the caller runs it. stop() may be called
// from any thread and is idempotent. Once stop() returns no new firing starts.
// The io_context must stop running handlers before this object is destroyed.
class UpdateLoop {
public:
  UpdateLoop(asio::io_context& io_context, NodeStore& store,
             std::chrono::steady_clock::duration interval = DEFAULT_UPDATE_INTERVAL);
  ~UpdateLoop();

  UpdateLoop(const UpdateLoop&) = delete;
  UpdateLoop& operator=(const UpdateLoop&) = delete;

  // Returns false if already running
  bool start();
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }

  // Number of completed firings since construction
  uint64_t tick_count() const { return ticks_.load(std::memory_order_acquire); }

  std::chrono::steady_clock::duration interval() const { return interval_; }

private:
  void schedule_next();
  void fire(uint64_t generation);

  NodeStore& store_;
  const std::chrono::steady_clock::duration interval_;

  // Serializes timer_ member calls between the io thread (re-arm) and stop()
  std::mutex timer_mutex_;
  asio::steady_timer timer_;
  // Bumped on every start(); firings armed by an earlier run are ignored
  uint64_t generation_{0};

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> ticks_{0};
};

}  // namespace sim
}  // namespace nodesim
