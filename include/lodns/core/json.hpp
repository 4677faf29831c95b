// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lodns
{
namespace core
{
  /// JSON type alias to avoid exposing third-party namespaces.
  using Json = nlohmann::json;

  /// \brief Compact serialization; invalid UTF-8 is replaced with U+FFFD
  /// instead of throwing.
  inline std::string dumpCompact(const Json& value)
  {
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
  }

  /// \brief Parse without exceptions; std::nullopt when the text is not JSON.
  inline std::optional<Json> tryParse(const std::string& text)
  {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded())
    {
      return std::nullopt;
    }
    return parsed;
  }
} // namespace core
} // namespace lodns
