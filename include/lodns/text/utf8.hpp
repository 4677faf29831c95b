// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace lodns
{
namespace text
{
namespace utf8
{

inline bool isContinuation(unsigned char byte) { return (byte & 0xC0) == 0x80; }

/// \brief Sequence length announced by a lead byte, 0 if the byte cannot
/// start a sequence.
inline std::size_t sequenceLength(unsigned char lead)
{
  if (lead < 0x80)
    return 1;
  if ((lead & 0xE0) == 0xC0)
    return 2;
  if ((lead & 0xF0) == 0xE0)
    return 3;
  if ((lead & 0xF8) == 0xF0)
    return 4;
  return 0;
}

/// \brief Width in bytes of the unit starting at `pos`.
///
/// A lead byte followed by the announced number of continuation bytes is one
/// unit. Any other byte (stray continuation, bad lead, truncated sequence)
/// is a unit of its own, so arbitrary bytes never stall a scan.
inline std::size_t unitLength(const std::string& s, std::size_t pos)
{
  std::size_t len = sequenceLength(static_cast<unsigned char>(s[pos]));
  if (len <= 1 || pos + len > s.size())
  {
    return 1;
  }
  for (std::size_t i = 1; i < len; ++i)
  {
    if (!isContinuation(static_cast<unsigned char>(s[pos + i])))
    {
      return 1;
    }
  }
  return len;
}

/// \brief Largest unit boundary not greater than `pos`.
///
/// Walks back over at most three continuation bytes looking for the lead
/// byte of a unit that straddles `pos`.
inline std::size_t floorBoundary(const std::string& s, std::size_t pos)
{
  if (pos >= s.size())
  {
    return s.size();
  }
  std::size_t back = 0;
  while (back < 3 && back < pos && isContinuation(static_cast<unsigned char>(s[pos - back])))
  {
    ++back;
    std::size_t start = pos - back;
    if (!isContinuation(static_cast<unsigned char>(s[start])))
    {
      return start + unitLength(s, start) > pos ? start : pos;
    }
  }
  return pos;
}

/// \brief Strict validation: rejects overlong forms, surrogates and code
/// points above U+10FFFF.
inline bool isValid(const std::string& s)
{
  std::size_t i = 0;
  while (i < s.size())
  {
    unsigned char c = static_cast<unsigned char>(s[i]);
    std::size_t len = sequenceLength(c);
    if (len == 0 || i + len > s.size())
      return false;
    if (len == 1)
    {
      ++i;
      continue;
    }

    std::uint32_t cp = c & (0xFF >> (len + 1));
    for (std::size_t k = 1; k < len; ++k)
    {
      unsigned char cc = static_cast<unsigned char>(s[i + k]);
      if (!isContinuation(cc))
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }

    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
      return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
      return false;
    i += len;
  }
  return true;
}

} // namespace utf8
} // namespace text
} // namespace lodns
