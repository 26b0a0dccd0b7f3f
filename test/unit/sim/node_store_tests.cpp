// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for NodeStore

#include <catch2/catch_test_macros.hpp>

#include "sim/node_store.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace nodesim;
using namespace nodesim::sim;

namespace {

void RequireInitialized(const std::vector<NodeRecord>& nodes, int count) {
  REQUIRE(nodes.size() == static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    CHECK(nodes[i].id == i);
    CHECK(nodes[i].name == NodeName(i));
    CHECK(nodes[i].value >= 0);
    CHECK(nodes[i].value < MAX_NODE_VALUE);
  }
}

}  // namespace

TEST_CASE("NodeStore: Initialize creates N ordered records", "[sim][store]") {
  NodeStore store(1);

  SECTION("single node") {
    store.Initialize(1);
    RequireInitialized(store.Snapshot(), 1);
  }

  SECTION("default simulator size") {
    store.Initialize(5);
    RequireInitialized(store.Snapshot(), 5);
  }

  SECTION("larger collection") {
    store.Initialize(257);
    RequireInitialized(store.Snapshot(), 257);
    CHECK(store.Size() == 257);
  }
}

TEST_CASE("NodeStore: Initialize stamps records with the current time", "[sim][store]") {
  const int64_t mock = 1'700'000'000'000'000'000;
  util::SetMockTime(mock);

  NodeStore store(7);
  store.Initialize(4);
  auto expected = util::GetTimePoint();
  for (const auto& node : store.Snapshot()) {
    CHECK(node.timestamp == expected);
  }

  util::SetMockTime(0);
}

TEST_CASE("NodeStore: re-Initialize discards the previous generation", "[sim][store]") {
  NodeStore store(3);
  store.Initialize(8);
  auto old_gen = store.Snapshot();

  store.Initialize(3);
  auto new_gen = store.Snapshot();

  RequireInitialized(new_gen, 3);
  CHECK(store.Size() == 3);
  // The earlier copy is untouched
  RequireInitialized(old_gen, 8);
}

TEST_CASE("NodeStore: precondition violations throw", "[sim][store]") {
  NodeStore store;

  CHECK_FALSE(store.IsInitialized());
  CHECK(store.Size() == 0);

  CHECK_THROWS_AS(store.Snapshot(), std::logic_error);
  CHECK_THROWS_AS(store.UpdateRandom(), std::logic_error);
  CHECK_THROWS_AS(store.Initialize(0), std::invalid_argument);
  CHECK_THROWS_AS(store.Initialize(-3), std::invalid_argument);

  // A rejected Initialize leaves the store empty
  CHECK_FALSE(store.IsInitialized());

  store.Initialize(2);
  CHECK(store.IsInitialized());
  CHECK_NOTHROW(store.UpdateRandom());
}

TEST_CASE("NodeStore: UpdateRandom changes only the chosen record", "[sim][store]") {
  NodeStore store(12345);
  store.Initialize(10);

  for (int iter = 0; iter < 500; ++iter) {
    auto before = store.Snapshot();
    int id = store.UpdateRandom();
    auto after = store.Snapshot();

    REQUIRE(id >= 0);
    REQUIRE(id < 10);
    REQUIRE(after.size() == before.size());

    for (size_t i = 0; i < after.size(); ++i) {
      if (static_cast<int>(i) == id) {
        CHECK(after[i].id == before[i].id);
        CHECK(after[i].name == before[i].name);
        CHECK(after[i].value >= 0);
        CHECK(after[i].value < MAX_NODE_VALUE);
        CHECK(after[i].timestamp >= before[i].timestamp);
      } else {
        CHECK(after[i] == before[i]);
      }
    }
  }
}

TEST_CASE("NodeStore: UpdateRandom sets timestamp to now", "[sim][store]") {
  NodeStore store(99);

  util::SetMockTime(1'000'000'000'000'000'000);
  store.Initialize(3);

  util::SetMockTime(1'000'000'005'000'000'000);
  int id = store.UpdateRandom();
  auto nodes = store.Snapshot();
  CHECK(nodes[id].timestamp == util::GetTimePoint());

  util::SetMockTime(0);
}

TEST_CASE("NodeStore: UpdateRandom eventually visits every record", "[sim][store]") {
  NodeStore store(2024);
  store.Initialize(10);

  std::set<int> seen;
  for (int i = 0; i < 2000 && seen.size() < 10; ++i) {
    seen.insert(store.UpdateRandom());
  }
  CHECK(seen.size() == 10);
}

TEST_CASE("NodeStore: snapshots are independent copies", "[sim][store]") {
  NodeStore store(5);
  store.Initialize(5);

  SECTION("idempotent reads") {
    auto a = store.Snapshot();
    auto b = store.Snapshot();
    CHECK(a == b);
  }

  SECTION("later updates do not reach an earlier snapshot") {
    auto snap = store.Snapshot();
    auto copy = snap;
    for (int i = 0; i < 50; ++i) {
      store.UpdateRandom();
    }
    CHECK(snap == copy);
  }
}

TEST_CASE("NodeStore: concurrent readers never observe partial updates", "[sim][store][concurrency]") {
  constexpr int kNodes = 8;
  constexpr int kWrites = 2000;
  constexpr int kReaders = 4;
  constexpr size_t kMaxSnapshotsPerReader = 3000;

  NodeStore store(777);
  store.Initialize(kNodes);

  // Every state each record has really been in
  std::map<int, std::vector<NodeRecord>> history;
  for (const auto& node : store.Snapshot()) {
    history[node.id].push_back(node);
  }

  std::atomic<bool> writer_done{false};
  std::vector<std::vector<std::vector<NodeRecord>>> observed(kReaders);

  std::vector<std::thread> readers;
  for (int r = 0; r < kReaders; ++r) {
    readers.emplace_back([&, r]() {
      do {
        observed[r].push_back(store.Snapshot());
      } while (!writer_done.load() && observed[r].size() < kMaxSnapshotsPerReader);
    });
  }

  // Single writer: the snapshot right after an update is exactly the state it wrote
  std::thread writer([&]() {
    for (int i = 0; i < kWrites; ++i) {
      int id = store.UpdateRandom();
      history[id].push_back(store.Snapshot()[id]);
    }
    writer_done.store(true);
  });

  writer.join();
  for (auto& t : readers) {
    t.join();
  }

  size_t checked = 0;
  for (const auto& snaps : observed) {
    for (const auto& snap : snaps) {
      REQUIRE(snap.size() == static_cast<size_t>(kNodes));
      for (int i = 0; i < kNodes; ++i) {
        REQUIRE(snap[i].id == i);
        const auto& states = history[i];
        bool real_state = std::find(states.begin(), states.end(), snap[i]) != states.end();
        REQUIRE(real_state);
        ++checked;
      }
    }
  }
  INFO("records checked: " << checked);
  CHECK(checked > 0);
}
