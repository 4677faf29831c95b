// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using lodns::text::ChunkSet;
using lodns::text::TextChunker;
namespace utf8 = lodns::text::utf8;

TEST_CASE("Chunking preserves text for any chunk size", "[chunker]")
{
  const std::string text = "The quick brown fox jumps over the lazy dog. "
                           "Caf\xC3\xA9 na\xC3\xAFve \xE2\x82\xAC 10 \xF0\x9F\x98\x80 done.";

  for (std::size_t k : {4u, 5u, 7u, 16u, 100u, 250u, 255u})
  {
    ChunkSet chunks = TextChunker::chunk(text, k);
    REQUIRE(TextChunker::dechunk(chunks) == text);
    for (const auto& c : chunks)
    {
      REQUIRE(c.size() <= k);
      REQUIRE_FALSE(c.empty());
      REQUIRE(utf8::isValid(c));
    }
  }
}

TEST_CASE("Chunking ASCII text", "[chunker]")
{
  SECTION("600 bytes with k=250 gives 250, 250, 100")
  {
    ChunkSet chunks = TextChunker::chunk(std::string(600, 'x'), 250);
    REQUIRE(chunks.size() == 3);
    REQUIRE(chunks[0].size() == 250);
    REQUIRE(chunks[1].size() == 250);
    REQUIRE(chunks[2].size() == 100);
  }

  SECTION("Exact multiple leaves no trailing empty chunk")
  {
    ChunkSet chunks = TextChunker::chunk(std::string(500, 'y'), 250);
    REQUIRE(chunks.size() == 2);
    REQUIRE(chunks[1].size() == 250);
  }

  SECTION("Short text is a single chunk")
  {
    ChunkSet chunks = TextChunker::chunk("hello", 250);
    REQUIRE(chunks == ChunkSet{"hello"});
  }

  SECTION("Empty text is one empty chunk")
  {
    ChunkSet chunks = TextChunker::chunk("", 250);
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks[0].empty());
  }
}

TEST_CASE("Chunking never splits a code point", "[chunker][utf8]")
{
  // 249 ASCII bytes then a 2-byte character straddling the 250 boundary
  std::string text = std::string(249, 'a') + "\xC3\xA9" + "tail";
  ChunkSet chunks = TextChunker::chunk(text, 250);

  REQUIRE(chunks.size() == 2);
  REQUIRE(chunks[0] == std::string(249, 'a'));
  REQUIRE(chunks[1] == "\xC3\xA9tail");
  REQUIRE(TextChunker::dechunk(chunks) == text);

  // Four-byte emoji with k=4 fit exactly one per chunk
  std::string emoji = "\xF0\x9F\x98\x80\xF0\x9F\x98\x81";
  chunks = TextChunker::chunk(emoji, 4);
  REQUIRE(chunks.size() == 2);
  REQUIRE(chunks[0] == "\xF0\x9F\x98\x80");
}

TEST_CASE("Chunking rejects unusable chunk sizes", "[chunker][errors]")
{
  REQUIRE_THROWS_AS(TextChunker::chunk("abc", 0), std::invalid_argument);
  REQUIRE_THROWS_AS(TextChunker::chunk("\xF0\x9F\x98\x80", 3), std::invalid_argument);
  REQUIRE_NOTHROW(TextChunker::chunk("abc", 1));
}

TEST_CASE("Chunking applies the total size cap", "[chunker][truncate]")
{
  ChunkSet chunks = TextChunker::chunk(std::string(5000, 'z'), 250, 4096);
  REQUIRE(TextChunker::dechunk(chunks).size() == 4096);
  REQUIRE(chunks.size() == 17);
  REQUIRE(chunks.back().size() == 96);
}

TEST_CASE("Truncation ends on a code point boundary", "[chunker][truncate]")
{
  std::string text = "ab\xE2\x82\xAC" "cd"; // a b EURO c d

  REQUIRE(TextChunker::truncate(text, 10) == text);
  REQUIRE(TextChunker::truncate(text, 5) == "ab\xE2\x82\xAC");
  REQUIRE(TextChunker::truncate(text, 4) == "ab");
  REQUIRE(TextChunker::truncate(text, 3) == "ab");
  REQUIRE(TextChunker::truncate(text, 2) == "ab");
  REQUIRE(TextChunker::truncate(text, 0).empty());
}

TEST_CASE("UTF-8 helpers", "[utf8]")
{
  REQUIRE(utf8::isValid("plain ascii"));
  REQUIRE(utf8::isValid("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80"));
  REQUIRE_FALSE(utf8::isValid("\xC3"));
  REQUIRE_FALSE(utf8::isValid("\x80"));
  REQUIRE_FALSE(utf8::isValid("\xC0\xAF"));
  REQUIRE_FALSE(utf8::isValid("\xED\xA0\x80"));

  std::string euro = "x\xE2\x82\xAC";
  REQUIRE(utf8::unitLength(euro, 0) == 1);
  REQUIRE(utf8::unitLength(euro, 1) == 3);
  REQUIRE(utf8::floorBoundary(euro, 3) == 1);
  REQUIRE(utf8::floorBoundary(euro, 4) == 4);

  // Stray continuation bytes count as single units
  std::string broken = "a\x80" "b";
  REQUIRE(utf8::unitLength(broken, 1) == 1);
  ChunkSet chunks = TextChunker::chunk(broken, 1);
  REQUIRE(chunks.size() == 3);
}
