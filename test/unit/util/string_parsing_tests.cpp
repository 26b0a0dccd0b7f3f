// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "util/string_parsing.hpp"

using namespace nodesim::util;

TEST_CASE("SafeParseInt accepts only clean in-range integers", "[util][parsing]") {
  SECTION("valid values") {
    CHECK(SafeParseInt("0", 0, 10) == 0);
    CHECK(SafeParseInt("10", 0, 10) == 10);
    CHECK(SafeParseInt("-5", -10, 10) == -5);
  }

  SECTION("out of range") {
    CHECK_FALSE(SafeParseInt("11", 0, 10).has_value());
    CHECK_FALSE(SafeParseInt("-1", 0, 10).has_value());
    CHECK_FALSE(SafeParseInt("99999999999999999999", 0, 10).has_value());
  }

  SECTION("malformed input") {
    CHECK_FALSE(SafeParseInt("", 0, 10).has_value());
    CHECK_FALSE(SafeParseInt(" 5", 0, 10).has_value());
    CHECK_FALSE(SafeParseInt("5 ", 0, 10).has_value());
    CHECK_FALSE(SafeParseInt("+5", 0, 10).has_value());
    CHECK_FALSE(SafeParseInt("5abc", 0, 10).has_value());
    CHECK_FALSE(SafeParseInt("0x5", 0, 10).has_value());
  }
}

TEST_CASE("SafeParsePort", "[util][parsing]") {
  CHECK(SafeParsePort("8080") == 8080);
  CHECK(SafeParsePort("1") == 1);
  CHECK(SafeParsePort("65535") == 65535);
  CHECK_FALSE(SafeParsePort("0").has_value());
  CHECK_FALSE(SafeParsePort("65536").has_value());
  CHECK_FALSE(SafeParsePort("http").has_value());
}
