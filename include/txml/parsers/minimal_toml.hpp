// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace txml
{
namespace parsers
{
namespace toml
{
/// \brief Subset of TOML used by txml configuration files.
///
/// Supported: [table] and [dotted.table] headers, bare and dotted keys, basic ("...") and
/// literal ('...') strings, integers, floats, booleans, single- and multi-line arrays, '#'
/// comments. Not supported: inline tables, arrays of tables, dates, multi-line strings.

class Table;
class Array;

using Value = std::variant<std::monostate, std::int64_t, double, bool, std::string,
                           std::shared_ptr<Table>, std::shared_ptr<Array>>;

/// \brief Thrown for malformed input; the message carries the 1-based line number.
class ParseError : public std::runtime_error
{
public:
  ParseError(const std::string &message, std::size_t line)
    : std::runtime_error("toml: line " + std::to_string(line) + ": " + message), _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class Array
{
public:
  using Container = std::vector<Value>;

  void push(Value value) { _values.push_back(std::move(value)); }
  std::size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }
  Container::const_iterator begin() const { return _values.begin(); }
  Container::const_iterator end() const { return _values.end(); }
  const Value &operator[](std::size_t idx) const { return _values[idx]; }

private:
  Container _values;
};

/// \brief Borrowed handle to one value; empty when a lookup failed.
class Node
{
public:
  Node() = default;
  explicit Node(const Value *value) : _value(value) {}

  explicit operator bool() const { return _value != nullptr; }

  bool isValue() const
  {
    return _value && !std::holds_alternative<std::monostate>(*_value) && !isTable() && !isArray();
  }
  bool isTable() const { return _value && std::holds_alternative<std::shared_ptr<Table>>(*_value); }
  bool isArray() const { return _value && std::holds_alternative<std::shared_ptr<Array>>(*_value); }

  /// \brief Typed access; integers widen to double, nothing else converts.
  template <typename T> std::optional<T> as() const
  {
    if (!_value)
    {
      return std::nullopt;
    }
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *i = std::get_if<std::int64_t>(_value))
      {
        return static_cast<double>(*i);
      }
    }
    if (auto *v = std::get_if<T>(_value))
    {
      return *v;
    }
    return std::nullopt;
  }

  const Table *asTable() const
  {
    auto *t = _value ? std::get_if<std::shared_ptr<Table>>(_value) : nullptr;
    return t ? t->get() : nullptr;
  }

  const Array *asArray() const
  {
    auto *a = _value ? std::get_if<std::shared_ptr<Array>>(_value) : nullptr;
    return a ? a->get() : nullptr;
  }

private:
  const Value *_value{nullptr};
};

class Table
{
public:
  bool contains(const std::string &key) const { return _values.count(key) != 0; }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  Node get(const std::string &key) const
  {
    auto it = _values.find(key);
    return it == _values.end() ? Node{} : Node{&it->second};
  }

  /// \brief Look up "a.b.c" through nested tables.
  Node atPath(const std::string &dottedPath) const
  {
    const Table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      Node node = current->get(part);
      if (dot == std::string::npos || !node)
      {
        return node;
      }
      current = node.asTable();
      start = dot + 1;
    }
    return Node{};
  }

  Value &slot(const std::string &key) { return _values[key]; }

private:
  std::map<std::string, Value> _values;
};

class Parser
{
public:
  explicit Parser(std::string input) : _input(std::move(input)) {}

  Table parse()
  {
    Table root;
    Table *current = &root;
    while (true)
    {
      skipBlankLines();
      if (atEnd())
      {
        break;
      }
      if (peek() == '[')
      {
        advance();
        skipSpaces();
        std::vector<std::string> path = parseKeyPath();
        skipSpaces();
        expect(']', "expected ']' to close table header");
        current = descend(root, path, true);
      }
      else
      {
        std::vector<std::string> path = parseKeyPath();
        skipSpaces();
        expect('=', "expected '=' after key");
        skipSpaces();
        Value value = parseValue();
        std::string leaf = path.back();
        path.pop_back();
        Table *target = descend(*current, path, false);
        if (target->contains(leaf))
        {
          throw ParseError("duplicate key '" + leaf + "'", _line);
        }
        target->slot(leaf) = std::move(value);
      }
      finishLine();
    }
    return root;
  }

private:
  bool atEnd() const { return _pos >= _input.size(); }
  char peek() const { return atEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    char c = _input[_pos++];
    if (c == '\n')
    {
      ++_line;
    }
    return c;
  }

  void expect(char c, const char *message)
  {
    if (peek() != c)
    {
      throw ParseError(message, _line);
    }
    advance();
  }

  void skipSpaces()
  {
    while (!atEnd() && (peek() == ' ' || peek() == '\t'))
    {
      advance();
    }
  }

  void skipComment()
  {
    while (!atEnd() && peek() != '\n')
    {
      advance();
    }
  }

  void skipBlankLines()
  {
    while (!atEnd())
    {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
      {
        advance();
      }
      else if (c == '#')
      {
        skipComment();
      }
      else
      {
        break;
      }
    }
  }

  // After a statement only spaces and a comment may precede the newline.
  void finishLine()
  {
    skipSpaces();
    if (peek() == '#')
    {
      skipComment();
    }
    if (peek() == '\r')
    {
      advance();
    }
    if (!atEnd() && peek() != '\n')
    {
      throw ParseError("unexpected trailing characters", _line);
    }
  }

  std::vector<std::string> parseKeyPath()
  {
    std::vector<std::string> path;
    while (true)
    {
      std::string key;
      if (peek() == '"' || peek() == '\'')
      {
        key = parseString();
      }
      else
      {
        while (!atEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                            peek() == '-'))
        {
          key.push_back(advance());
        }
        if (key.empty())
        {
          throw ParseError("expected a key", _line);
        }
      }
      path.push_back(std::move(key));
      skipSpaces();
      if (peek() != '.')
      {
        return path;
      }
      advance();
      skipSpaces();
    }
  }

  Table *descend(Table &from, const std::vector<std::string> &path, bool header)
  {
    Table *current = &from;
    for (const auto &key : path)
    {
      Value &slot = current->slot(key);
      if (std::holds_alternative<std::monostate>(slot))
      {
        slot = std::make_shared<Table>();
      }
      auto *next = std::get_if<std::shared_ptr<Table>>(&slot);
      if (!next)
      {
        throw ParseError(std::string(header ? "table header" : "key") + " '" + key +
                           "' is already a value",
                         _line);
      }
      current = next->get();
    }
    return current;
  }

  Value parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
    {
      return parseString();
    }
    if (c == '[')
    {
      return parseArray();
    }
    if (c == 't' || c == 'f')
    {
      return parseBool();
    }
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
    {
      return parseNumber();
    }
    throw ParseError("invalid value", _line);
  }

  std::string parseString()
  {
    char quote = advance();
    std::string out;
    while (!atEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c == '\\' && quote == '"' && !atEnd())
      {
        char esc = advance();
        switch (esc)
        {
        case 'n':
          out.push_back('\n');
          break;
        case 't':
          out.push_back('\t');
          break;
        case 'r':
          out.push_back('\r');
          break;
        case '"':
        case '\\':
          out.push_back(esc);
          break;
        default:
          throw ParseError(std::string("invalid escape '\\") + esc + "'", _line);
        }
      }
      else
      {
        out.push_back(c);
      }
    }
    if (peek() != quote)
    {
      throw ParseError("unterminated string", _line);
    }
    advance();
    return out;
  }

  Value parseArray()
  {
    advance();
    auto arr = std::make_shared<Array>();
    skipBlankLines();
    while (!atEnd() && peek() != ']')
    {
      arr->push(parseValue());
      skipBlankLines();
      if (peek() == ',')
      {
        advance();
        skipBlankLines();
      }
      else if (peek() != ']')
      {
        throw ParseError("expected ',' or ']' in array", _line);
      }
    }
    expect(']', "unterminated array");
    return arr;
  }

  bool parseBool()
  {
    std::string word;
    while (!atEnd() && std::isalpha(static_cast<unsigned char>(peek())))
    {
      word.push_back(advance());
    }
    if (word == "true")
    {
      return true;
    }
    if (word == "false")
    {
      return false;
    }
    throw ParseError("invalid boolean '" + word + "'", _line);
  }

  Value parseNumber()
  {
    std::string num;
    bool isFloat = false;
    while (!atEnd())
    {
      char c = peek();
      if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '_')
      {
        advance();
        if (c != '_')
        {
          num.push_back(c);
        }
      }
      else if (c == '.' || c == 'e' || c == 'E')
      {
        isFloat = true;
        num.push_back(advance());
      }
      else
      {
        break;
      }
    }
    std::size_t used = 0;
    try
    {
      if (isFloat)
      {
        double d = std::stod(num, &used);
        if (used == num.size())
        {
          return d;
        }
      }
      else
      {
        long long i = std::stoll(num, &used);
        if (used == num.size())
        {
          return static_cast<std::int64_t>(i);
        }
      }
    }
    catch (const std::logic_error &)
    {
    }
    throw ParseError("invalid number '" + num + "'", _line);
  }

  std::string _input;
  std::size_t _pos{0};
  std::size_t _line{1};
};

inline Table parse(const std::string &text) { return Parser(text).parse(); }

inline Table parseFile(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    throw std::runtime_error("Cannot open file: " + filename);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace txml
