// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace nodesim {

inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "." + std::to_string(VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return "nodesim v" + GetVersionString();
}

inline std::string GetStartupBanner(int node_count, unsigned port) {
  return "=== " + GetFullVersionString() + " ===\n" + "Simulating " + std::to_string(node_count) +
         " nodes, serving http://localhost:" + std::to_string(port) + "\n";
}

}  // namespace nodesim
