// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

namespace lodns
{
namespace parsers
{
namespace dotenv
{

/// \brief Raised when a dotenv file cannot be parsed.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string& message, std::size_t line)
      : std::runtime_error("dotenv parse error at line " + std::to_string(line) + ": " + message),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

using variables = std::map<std::string, std::string>;

namespace detail
{
inline std::string trim(const std::string& s)
{
  auto b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos)
    return "";
  auto e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

inline bool is_key_char(char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

/// Double-quoted value with \n, \t, \", \\ escapes; `rest` must follow the
/// opening quote.
inline std::string unquote_double(const std::string& rest, std::size_t line)
{
  std::string out;
  for (std::size_t i = 0; i < rest.size(); ++i)
  {
    char c = rest[i];
    if (c == '"')
    {
      auto tail = trim(rest.substr(i + 1));
      if (!tail.empty() && tail[0] != '#')
        throw parse_error("Unexpected text after closing quote", line);
      return out;
    }
    if (c == '\\' && i + 1 < rest.size())
    {
      char n = rest[++i];
      switch (n)
      {
      case 'n':
        out += '\n';
        break;
      case 't':
        out += '\t';
        break;
      case 'r':
        out += '\r';
        break;
      default:
        out += n;
        break;
      }
      continue;
    }
    out += c;
  }
  throw parse_error("Unterminated double-quoted value", line);
}
} // namespace detail

/// \brief Parse `KEY=VALUE` lines.
///
/// Blank lines and `#` comments are skipped, a leading `export ` is
/// accepted. Single-quoted values are literal, double-quoted values take
/// escapes, unquoted values are trimmed and cut at ` #`. A later
/// assignment of the same key replaces the earlier one.
inline variables parse(const std::string& content)
{
  variables vars;
  std::istringstream in(content);
  std::string raw;
  std::size_t lineNo = 0;
  while (std::getline(in, raw))
  {
    ++lineNo;
    std::string line = detail::trim(raw);
    if (line.empty() || line[0] == '#')
      continue;
    if (line.compare(0, 7, "export ") == 0)
      line = detail::trim(line.substr(7));

    auto eq = line.find('=');
    if (eq == std::string::npos)
      throw parse_error("Expected KEY=VALUE", lineNo);

    std::string key = detail::trim(line.substr(0, eq));
    if (key.empty())
      throw parse_error("Empty key", lineNo);
    for (char c : key)
    {
      if (!detail::is_key_char(c))
        throw parse_error("Invalid character in key '" + key + "'", lineNo);
    }

    std::string value = detail::trim(line.substr(eq + 1));
    if (!value.empty() && value[0] == '"')
    {
      value = detail::unquote_double(value.substr(1), lineNo);
    }
    else if (!value.empty() && value[0] == '\'')
    {
      auto close = value.find('\'', 1);
      if (close == std::string::npos)
        throw parse_error("Unterminated single-quoted value", lineNo);
      value = value.substr(1, close - 1);
    }
    else
    {
      auto comment = value.find(" #");
      if (comment != std::string::npos)
        value = detail::trim(value.substr(0, comment));
    }
    vars[key] = value;
  }
  return vars;
}

/// \throws std::runtime_error if the file cannot be opened
inline variables parse_file(const std::string& filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace dotenv
} // namespace parsers
} // namespace lodns
