// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace lodns
{
namespace parsers
{
namespace toml
{

/// \brief Raised when a TOML document cannot be parsed.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string& message, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + message),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

class array
{
public:
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  void push_back(value_type&& val) { _values.push_back(std::move(val)); }

  std::size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  const value_type& operator[](std::size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

/// \brief A single value in a TOML document; empty when a lookup misses.
class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const
  {
    return !std::holds_alternative<std::monostate>(_value) && !is_table() && !is_array();
  }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto* val = std::get_if<double>(&_value))
        return *val;
      if (auto* val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
    }
    else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, bool> ||
                       std::is_same_v<T, std::string>)
    {
      if (auto* val = std::get_if<T>(&_value))
        return *val;
    }
    return std::nullopt;
  }

  const array* as_array() const
  {
    if (auto* val = std::get_if<std::shared_ptr<array>>(&_value))
      return val->get();
    return nullptr;
  }

  table* as_table() const
  {
    if (auto* val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string& key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  node get(const std::string& key) const
  {
    auto it = _values.find(key);
    return it == _values.end() ? node() : it->second;
  }

  void insert(const std::string& key, node value) { _values[key] = std::move(value); }

  /// \brief Look up a value by dotted path, e.g. "dns.port".
  node at_path(const std::string& dottedPath) const
  {
    const table* current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      node found = current->get(part);
      if (dot == std::string::npos || !found)
      {
        return found;
      }
      current = found.as_table();
      start = dot + 1;
    }
    return node();
  }

private:
  container_type _values;
};

/// \brief Parser for the TOML subset used by lodns configuration files:
/// tables, dotted keys, basic and literal strings, integers, floats,
/// booleans, arrays and comments.
class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table* current = &root;

    while (true)
    {
      skipBlankLines();
      if (isEnd())
        break;

      if (peek() == '[')
      {
        current = ensureTable(root, parseHeader());
      }
      else
      {
        parseKeyValue(*current);
      }
      expectEndOfLine();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  [[noreturn]] void fail(const std::string& message) const { throw parse_error(message, _line); }

  void skipSpaces()
  {
    while (peek() == ' ' || peek() == '\t')
      advance();
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
        advance();
    }
  }

  void skipBlankLines()
  {
    while (!isEnd())
    {
      skipSpaces();
      skipComment();
      if (peek() == '\n' || peek() == '\r')
        advance();
      else
        break;
    }
  }

  void skipArrayWhitespace()
  {
    while (!isEnd())
    {
      skipSpaces();
      skipComment();
      if (peek() == '\n' || peek() == '\r')
        advance();
      else
        break;
    }
  }

  void expectEndOfLine()
  {
    skipSpaces();
    skipComment();
    if (peek() == '\r')
      advance();
    if (!isEnd() && peek() != '\n')
      fail(std::string("Unexpected character '") + peek() + "'");
  }

  std::vector<std::string> parseHeader()
  {
    advance(); // '['
    if (peek() == '[')
      fail("Arrays of tables are not supported");
    skipSpaces();
    auto path = parseKeyPath();
    skipSpaces();
    if (peek() != ']')
      fail("Unterminated table header");
    advance();
    return path;
  }

  std::vector<std::string> parseKeyPath()
  {
    std::vector<std::string> parts;
    while (true)
    {
      skipSpaces();
      std::string part;
      if (peek() == '"' || peek() == '\'')
      {
        part = parseString();
      }
      else
      {
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
               peek() == '-')
          part += advance();
      }
      if (part.empty())
        fail("Expected key");
      parts.push_back(std::move(part));
      skipSpaces();
      if (peek() != '.')
        break;
      advance();
    }
    return parts;
  }

  void parseKeyValue(table& current)
  {
    auto path = parseKeyPath();
    if (peek() != '=')
      fail("Expected '=' after key");
    advance();
    skipSpaces();

    std::string leaf = path.back();
    path.pop_back();
    table* target = ensureTable(current, path);
    if (target->contains(leaf))
      fail("Duplicate key: " + leaf);
    target->insert(leaf, node(parseValue()));
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return parseString();
    if (c == '[')
      return parseArray();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    fail("Invalid value");
  }

  std::string parseString()
  {
    char quote = advance();
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c != '\\' || quote == '\'')
      {
        str += c;
        continue;
      }
      char escaped = advance();
      switch (escaped)
      {
      case 'n':
        str += '\n';
        break;
      case 't':
        str += '\t';
        break;
      case 'r':
        str += '\r';
        break;
      case '\\':
        str += '\\';
        break;
      case '"':
        str += '"';
        break;
      default:
        fail(std::string("Invalid escape sequence \\") + escaped);
      }
    }
    if (peek() != quote)
      fail("Unterminated string");
    advance();
    return str;
  }

  value_type parseArray()
  {
    advance(); // '['
    auto arr = std::make_shared<array>();
    skipArrayWhitespace();
    while (!isEnd() && peek() != ']')
    {
      arr->push_back(parseValue());
      skipArrayWhitespace();
      if (peek() == ',')
      {
        advance();
        skipArrayWhitespace();
      }
      else if (peek() != ']')
      {
        fail("Expected ',' or ']' in array");
      }
    }
    if (peek() != ']')
      fail("Unterminated array");
    advance();
    return arr;
  }

  bool parseBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("Invalid boolean value: " + word);
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;
    if (peek() == '+' || peek() == '-')
      num += advance();
    while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '.' || peek() == 'e' ||
           peek() == 'E' || peek() == '_' ||
           ((peek() == '+' || peek() == '-') && !num.empty() &&
            (num.back() == 'e' || num.back() == 'E')))
    {
      char c = advance();
      if (c == '_')
        continue;
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      num += c;
    }

    try
    {
      std::size_t consumed = 0;
      value_type result;
      if (isFloat)
        result = std::stod(num, &consumed);
      else
        result = static_cast<int64_t>(std::stoll(num, &consumed));
      if (consumed != num.size())
        fail("Invalid number: " + num);
      return result;
    }
    catch (const std::logic_error&)
    {
      fail("Invalid number: " + num);
    }
  }

  table* ensureTable(table& root, const std::vector<std::string>& path)
  {
    table* current = &root;
    for (const auto& key : path)
    {
      if (!current->contains(key))
      {
        current->insert(key, node(std::make_shared<table>()));
      }
      current = current->get(key).as_table();
      if (!current)
        fail("Key is not a table: " + key);
    }
    return current;
  }
};

inline table parse(const std::string& tomlString)
{
  parser p(tomlString);
  return p.parse();
}

inline table parse_file(const std::string& filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace lodns
