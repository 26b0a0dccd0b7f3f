// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <charconv>
#include <system_error>

namespace nodesim {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  if (str.empty()) {
    return std::nullopt;
  }

  // from_chars does not accept '+', keep it that way
  int value = 0;
  const char* first = str.data();
  const char* last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }

  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto port = SafeParseInt(str, 1, 65535);
  if (!port) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*port);
}

}  // namespace util
}  // namespace nodesim
