// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sim/update_loop.hpp"

#include "sim/node_store.hpp"
#include "util/logging.hpp"

#include <exception>

namespace nodesim {
namespace sim {

UpdateLoop::UpdateLoop(asio::io_context& io_context, NodeStore& store, std::chrono::steady_clock::duration interval)
    : store_(store), interval_(interval), timer_(io_context) {}

UpdateLoop::~UpdateLoop() {
  stop();
}

bool UpdateLoop::start() {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  running_.store(true, std::memory_order_release);
  ++generation_;
  LOG_SIM_INFO("Update loop started (interval {} ms)",
               std::chrono::duration_cast<std::chrono::milliseconds>(interval_).count());

  // First firing one full interval from now
  schedule_next();
  return true;
}

void UpdateLoop::stop() {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  running_.store(false, std::memory_order_release);
  timer_.cancel();
  LOG_SIM_INFO("Update loop stopped after {} updates", ticks_.load(std::memory_order_acquire));
}

// Requires timer_mutex_ held
void UpdateLoop::schedule_next() {
  timer_.expires_after(interval_);
  timer_.async_wait([this, generation = generation_](const asio::error_code& ec) {
    // Cancelled: stop() ran or the timer is being destroyed; do not touch this
    if (ec) {
      return;
    }
    fire(generation);
  });
}

void UpdateLoop::fire(uint64_t generation) {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (!running_.load(std::memory_order_acquire) || generation != generation_) {
    return;
  }

  try {
    int id = store_.UpdateRandom();
    LOG_SIM_DEBUG("Updated node {}", id);
  } catch (const std::exception& e) {
    LOG_SIM_ERROR("Node update failed: {}", e.what());
  }
  ticks_.fetch_add(1, std::memory_order_acq_rel);

  schedule_next();
}

}  // namespace sim
}  // namespace nodesim
