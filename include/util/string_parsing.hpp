// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace nodesim {
namespace util {

// Parse a decimal integer in [min, max]. The whole string must be consumed;
// whitespace, a leading '+' and trailing characters are rejected.
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

// Parse a TCP port in [1, 65535].
std::optional<uint16_t> SafeParsePort(const std::string& str);

}  // namespace util
}  // namespace nodesim
