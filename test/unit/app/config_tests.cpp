// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "app/config.hpp"

using namespace nodesim::app;

TEST_CASE("ParseCommandLine: defaults", "[config][cli]") {
  auto result = ParseCommandLine({});
  REQUIRE(result.ok());
  CHECK(result.action == CliAction::Run);
  CHECK(result.config.listen_port == 8080);
  CHECK(result.config.node_count == 5);
  CHECK(result.config.update_interval == std::chrono::seconds(5));
  CHECK(result.config.io_threads == 2);
  CHECK(result.config.log_level == "info");
  CHECK_FALSE(result.config.log_to_file);
}

TEST_CASE("ParseCommandLine: options", "[config][cli]") {
  SECTION("all options together") {
    auto result = ParseCommandLine(
        {"--port=9000", "--nodes=12", "--interval=2", "--threads=4", "--loglevel=debug", "--logfile=/tmp/sim.log"});
    REQUIRE(result.ok());
    CHECK(result.action == CliAction::Run);
    CHECK(result.config.listen_port == 9000);
    CHECK(result.config.node_count == 12);
    CHECK(result.config.update_interval == std::chrono::seconds(2));
    CHECK(result.config.io_threads == 4);
    CHECK(result.config.log_level == "debug");
    CHECK(result.config.log_to_file);
    CHECK(result.config.log_file == "/tmp/sim.log");
  }

  SECTION("later option wins") {
    auto result = ParseCommandLine({"--nodes=3", "--nodes=8"});
    REQUIRE(result.ok());
    CHECK(result.config.node_count == 8);
  }

  SECTION("help and version short-circuit") {
    CHECK(ParseCommandLine({"--help"}).action == CliAction::Help);
    CHECK(ParseCommandLine({"-h"}).action == CliAction::Help);
    CHECK(ParseCommandLine({"--version"}).action == CliAction::Version);
    CHECK(ParseCommandLine({"-v", "--bogus"}).action == CliAction::Version);
  }
}

TEST_CASE("ParseCommandLine: invalid input", "[config][cli]") {
  auto rejects = [](const std::string& arg) { return !ParseCommandLine({arg}).ok(); };

  CHECK(rejects("--port=0"));
  CHECK(rejects("--port=70000"));
  CHECK(rejects("--port=abc"));
  CHECK(rejects("--nodes=0"));
  CHECK(rejects("--nodes=-3"));
  CHECK(rejects("--nodes="));
  CHECK(rejects("--interval=0"));
  CHECK(rejects("--interval=1.5"));
  CHECK(rejects("--threads=0"));
  CHECK(rejects("--threads=65"));
  CHECK(rejects("--loglevel=loud"));
  CHECK(rejects("--logfile="));

  auto unknown = ParseCommandLine({"--listen"});
  CHECK_FALSE(unknown.ok());
  CHECK(unknown.error == "Unknown option: --listen");
}

TEST_CASE("GetUsage lists every option", "[config][cli]") {
  std::string usage = GetUsage("nodesim");
  CHECK(usage.find("Usage: nodesim [options]") != std::string::npos);
  for (const char* opt : {"--port=", "--nodes=", "--interval=", "--threads=", "--loglevel=", "--logfile=",
                          "--version", "--help"}) {
    CHECK(usage.find(opt) != std::string::npos);
  }
}
