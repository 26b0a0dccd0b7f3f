// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace nodesim {
namespace util {

// Wall-clock time used for node timestamps. Returns the mock time when one
// is set, otherwise std::chrono::system_clock::now().
std::chrono::system_clock::time_point GetTimePoint();

// Set mock wall-clock time in nanoseconds since the epoch (0 disables).
// Testing only.
void SetMockTime(int64_t unix_nanos);

int64_t GetMockTime();

// Format as RFC 3339 in UTC, e.g. "2025-01-02T03:04:05.123456789Z".
// Trailing zeros of the fraction are trimmed; whole seconds have no fraction.
std::string FormatRFC3339(std::chrono::system_clock::time_point tp);

}  // namespace util
}  // namespace nodesim
