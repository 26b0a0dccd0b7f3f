// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <iomanip>
#include <sstream>

namespace nodesim {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<int64_t> g_mock_time{0};

std::chrono::system_clock::time_point GetTimePoint() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds{mock})};
  }
  return std::chrono::system_clock::now();
}

void SetMockTime(int64_t unix_nanos) {
  g_mock_time.store(unix_nanos, std::memory_order_relaxed);
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

std::string FormatRFC3339(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;

  const auto nanos = time_point_cast<nanoseconds>(tp);
  const auto secs = floor<seconds>(nanos);
  const auto days = floor<std::chrono::days>(secs);
  const year_month_day ymd{days};
  const hh_mm_ss hms{secs - days};
  const int64_t frac = (nanos - secs).count();

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << "-" << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << "-" << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
      << std::setw(2) << hms.hours().count() << ":" << std::setw(2) << hms.minutes().count() << ":" << std::setw(2)
      << hms.seconds().count();

  if (frac != 0) {
    std::ostringstream frac_oss;
    frac_oss << std::setfill('0') << std::setw(9) << frac;
    std::string digits = frac_oss.str();
    while (!digits.empty() && digits.back() == '0') {
      digits.pop_back();
    }
    oss << "." << digits;
  }

  oss << "Z";
  return oss.str();
}

}  // namespace util
}  // namespace nodesim
