// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include "lodns/parsers/env_file.hpp"

namespace dotenv = lodns::parsers::dotenv;

TEST_CASE("dotenv assignments", "[dotenv]")
{
  auto vars = dotenv::parse("# credentials\n"
                            "OPENROUTER_API_KEY=sk-or-v1-abc\n"
                            "\n"
                            "export PORT = 5353\n"
                            "SYSTEM_PROMPT=\"Answer \\\"briefly\\\"\\nplease\"\n"
                            "OPENROUTER_MODEL='a/one, b/two # not a comment'\n"
                            "HOST=127.0.0.1 # loopback only\n"
                            "EMPTY=\n"
                            "PORT=6353\n");

  REQUIRE(vars.size() == 6);
  REQUIRE(vars["OPENROUTER_API_KEY"] == "sk-or-v1-abc");
  REQUIRE(vars["PORT"] == "6353");
  REQUIRE(vars["SYSTEM_PROMPT"] == "Answer \"briefly\"\nplease");
  REQUIRE(vars["OPENROUTER_MODEL"] == "a/one, b/two # not a comment");
  REQUIRE(vars["HOST"] == "127.0.0.1");
  REQUIRE(vars["EMPTY"].empty());
}

TEST_CASE("dotenv parse errors carry the line number", "[dotenv][errors]")
{
  try
  {
    dotenv::parse("A=1\nnot an assignment\n");
    FAIL("Expected parse_error");
  }
  catch (const dotenv::parse_error& e)
  {
    REQUIRE(e.line() == 2);
  }

  REQUIRE_THROWS_AS(dotenv::parse("BAD KEY=1\n"), dotenv::parse_error);
  REQUIRE_THROWS_AS(dotenv::parse("=1\n"), dotenv::parse_error);
  REQUIRE_THROWS_AS(dotenv::parse("A=\"open\n"), dotenv::parse_error);
  REQUIRE_THROWS_AS(dotenv::parse("A='open\n"), dotenv::parse_error);
  REQUIRE_THROWS_AS(dotenv::parse("A=\"x\" trailing\n"), dotenv::parse_error);
}

TEST_CASE("dotenv parse_file", "[dotenv]")
{
  auto path = (std::filesystem::temp_directory_path() / "lodns_test_dotenv.env").string();
  lodns::test::ScopedPath cleanup(path);
  lodns::test::writeFile(path, "DNS_PORT=2053\r\n");

  auto vars = dotenv::parse_file(path);
  REQUIRE(vars.at("DNS_PORT") == "2053");

  REQUIRE_THROWS_AS(dotenv::parse_file(path + ".missing"), std::runtime_error);
}
