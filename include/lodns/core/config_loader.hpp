// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <lodns/parsers/minimal_toml.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lodns
{
namespace core
{
/// \brief Loads and parses a TOML configuration file.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error if the file cannot be read or parsed
  explicit ConfigLoader(const std::string& filename) : _filename(filename) { reload(); }

  /// \brief Builds a loader from an in-memory document.
  static ConfigLoader fromString(const std::string& document)
  {
    return ConfigLoader(parsers::toml::parse(document));
  }

  /// \brief Reloads the configuration from disk.
  /// \throws std::runtime_error on read or parse failure; the previous table
  /// is kept in that case
  void reload()
  {
    if (_filename.empty())
    {
      return;
    }
    try
    {
      _table = parsers::toml::parse_file(_filename);
    }
    catch (const std::exception& e)
    {
      throw std::runtime_error("Failed to load configuration file " + _filename + ": " +
                               e.what());
    }
  }

  const std::string& filename() const { return _filename; }

  const parsers::toml::table& table() const { return _table; }

  /// \brief Gets a typed value by dotted key.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string& dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && node.is_value())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string& key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string& key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string& key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings.
  /// \return std::nullopt if the key is missing or not an array
  /// \throws std::runtime_error if an element is not a string
  std::optional<std::vector<std::string>> getStringArray(const std::string& key) const
  {
    auto node = _table.at_path(key);
    const auto* arr = node.as_array();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto& elem : *arr)
    {
      if (auto* strVal = std::get_if<std::string>(&elem))
      {
        result.push_back(*strVal);
      }
      else
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

private:
  explicit ConfigLoader(parsers::toml::table table) : _table(std::move(table)) {}

  std::string _filename;
  parsers::toml::table _table;
};

} // namespace core
} // namespace lodns
