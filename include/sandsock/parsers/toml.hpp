// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace sandsock
{
namespace parsers
{
namespace toml
{

/// \brief Raised for malformed input; carries the 1-based line.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &msg, std::size_t line)
      : std::runtime_error("TOML line " + std::to_string(line) + ": " + msg), _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string>;

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const { return !std::holds_alternative<std::monostate>(_value); }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }

  /// Integers also read as doubles; nothing else converts.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *i = std::get_if<int64_t>(&_value))
        return static_cast<double>(*i);
    }
    if (auto *val = std::get_if<T>(&_value))
      return *val;
    return std::nullopt;
  }

  explicit operator bool() const { return is_value(); }

private:
  value_type _value;
};

/// \brief Key/value pairs addressed by their full dotted path, so
/// "[a.b]\nc = 1" and "a.b.c = 1" produce the same entry.
class table
{
public:
  using container_type = std::map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &path) const { return _values.count(path) != 0; }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  node at_path(const std::string &path) const
  {
    auto it = _values.find(path);
    return it == _values.end() ? node() : it->second;
  }

  void insert(const std::string &path, node value) { _values[path] = std::move(value); }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

private:
  container_type _values;
};

class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    std::string section;

    while (true)
    {
      skipBlank();
      if (isEnd())
        break;

      if (peek() == '[')
      {
        section = parseSection();
      }
      else
      {
        std::string key = parseKey();
        skipSpaces();
        if (advance() != '=')
          fail("expected '=' after '" + key + "'");
        skipSpaces();
        std::string path = section.empty() ? key : section + "." + key;
        if (root.contains(path))
          fail("duplicate key '" + path + "'");
        root.insert(path, node(parseValue()));
      }
      endLine();
    }
    return root;
  }

private:
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

  [[noreturn]] void fail(const std::string &msg) const { throw parse_error(msg, _line); }

  void skipSpaces()
  {
    while (peek() == ' ' || peek() == '\t')
      advance();
  }

  void skipBlank()
  {
    while (!isEnd())
    {
      if (std::isspace(static_cast<unsigned char>(peek())))
        advance();
      else if (peek() == '#')
        skipComment();
      else
        break;
    }
  }

  void skipComment()
  {
    while (!isEnd() && peek() != '\n')
      advance();
  }

  /// Only whitespace or a comment may follow a statement.
  void endLine()
  {
    skipSpaces();
    if (peek() == '#')
      skipComment();
    if (!isEnd() && peek() != '\n' && peek() != '\r')
      fail(std::string("unexpected '") + peek() + "'");
  }

  static bool isKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
  }

  std::string parseKey()
  {
    std::string key;
    while (isKeyChar(peek()))
      key += advance();
    if (key.empty() || key.front() == '.' || key.back() == '.')
      fail("invalid key");
    return key;
  }

  std::string parseSection()
  {
    advance(); // '['
    skipSpaces();
    std::string name = parseKey();
    skipSpaces();
    if (advance() != ']')
      fail("unterminated section header");
    return name;
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return parseString();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    fail("invalid value");
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
      switch (char e = advance())
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
      default:
        str += e;
      }
    }
    if (advance() != quote)
      fail("unterminated string");
    return str;
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
    fail("invalid boolean '" + word + "'");
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;
    if (peek() == '+' || peek() == '-')
      num += advance();
    while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '.' ||
           peek() == 'e' || peek() == 'E' ||
           ((peek() == '+' || peek() == '-') && !num.empty() &&
            (num.back() == 'e' || num.back() == 'E')))
    {
      char c = advance();
      if (c == '_')
        continue;
      isFloat = isFloat || c == '.' || c == 'e' || c == 'E';
      num += c;
    }

    try
    {
      std::size_t used = 0;
      value_type result = isFloat ? value_type(std::stod(num, &used))
                                  : value_type(static_cast<int64_t>(std::stoll(num, &used)));
      if (used != num.size())
        fail("invalid number '" + num + "'");
      return result;
    }
    catch (const std::logic_error &)
    {
      fail("invalid number '" + num + "'");
    }
  }

  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};
};

inline table parse(const std::string &text) { return parser(text).parse(); }

inline table parse_file(const std::string &filename)
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
} // namespace sandsock
