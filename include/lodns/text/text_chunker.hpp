// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <lodns/text/utf8.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace lodns
{
namespace text
{

/// Ordered slices of a response, each small enough for one TXT
/// character-string.
using ChunkSet = std::vector<std::string>;

/// \brief Splits text into DNS character-string sized pieces without
/// cutting through a UTF-8 code point.
class TextChunker
{
public:
  static constexpr std::size_t DEFAULT_MAX_CHUNK_BYTES = 250;
  static constexpr std::size_t DEFAULT_MAX_TOTAL_BYTES = 4096;

  /// \brief Truncate to `maxTotalBytes`, then split into slices of at most
  /// `maxChunkBytes`. Empty input yields a single empty chunk.
  /// \throws std::invalid_argument if maxChunkBytes is 0 or a code point
  /// is wider than maxChunkBytes
  static ChunkSet chunk(const std::string& text,
                        std::size_t maxChunkBytes = DEFAULT_MAX_CHUNK_BYTES,
                        std::size_t maxTotalBytes = DEFAULT_MAX_TOTAL_BYTES)
  {
    if (maxChunkBytes == 0)
    {
      throw std::invalid_argument("maxChunkBytes must be at least 1");
    }

    std::string bounded = truncate(text, maxTotalBytes);
    ChunkSet chunks;
    if (bounded.empty())
    {
      chunks.emplace_back();
      return chunks;
    }

    std::size_t start = 0;
    std::size_t pos = 0;
    while (pos < bounded.size())
    {
      std::size_t unit = utf8::unitLength(bounded, pos);
      if (unit > maxChunkBytes)
      {
        throw std::invalid_argument("Code point of " + std::to_string(unit) +
                                    " bytes does not fit in a chunk of " +
                                    std::to_string(maxChunkBytes));
      }
      if (pos + unit - start > maxChunkBytes)
      {
        chunks.push_back(bounded.substr(start, pos - start));
        start = pos;
      }
      pos += unit;
    }
    chunks.push_back(bounded.substr(start));
    return chunks;
  }

  /// \brief Concatenate chunks in order.
  static std::string dechunk(const ChunkSet& chunks)
  {
    std::size_t total = 0;
    for (const auto& c : chunks)
    {
      total += c.size();
    }
    std::string out;
    out.reserve(total);
    for (const auto& c : chunks)
    {
      out += c;
    }
    return out;
  }

  /// \brief Longest prefix of at most `maxBytes` that ends on a code point
  /// boundary.
  static std::string truncate(const std::string& text, std::size_t maxBytes)
  {
    if (text.size() <= maxBytes)
    {
      return text;
    }
    return text.substr(0, utf8::floorBoundary(text, maxBytes));
  }
};

} // namespace text
} // namespace lodns
