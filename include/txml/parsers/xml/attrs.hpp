// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <txml/parsers/xml/error.hpp>
#include <txml/parsers/xml/text.hpp>

#include <optional>
#include <ostream>
#include <string_view>

namespace txml
{
namespace parsers
{
namespace xml
{
/// \brief One decoded attribute. Both members borrow from the input buffer.
struct Attribute
{
  std::string_view name;
  Text value; ///< Escaped; decode lazily
};

/// \brief Lazy decoder over the attribute text of an Open event.
///
/// The text holds zero or more `name="value"` pairs with no tag name, no trailing '/' and no
/// trailing whitespace. Each next() consumes one pair from the front. Copies are independent
/// cursors, so get() never disturbs the caller's position.
class Attrs
{
public:
  Attrs() = default;
  explicit Attrs(std::string_view text) : _rest(text) {}

  /// \brief The attribute text not yet consumed.
  std::string_view raw() const { return _rest; }

  bool empty() const { return detail::trimLeft(_rest).empty(); }

  /// \brief Decode the next pair.
  /// \return false at the end or on a malformed pair; error() tells which. A malformed pair
  /// clears the remaining text, so later calls return false with no error.
  bool next()
  {
    _error.reset();
    if (_state == State::Exhausted)
    {
      return false;
    }
    _rest = detail::trimLeft(_rest);
    if (_rest.empty())
    {
      _state = State::Exhausted;
      return false;
    }

    std::size_t eq = _rest.find('=');
    if (eq == std::string_view::npos)
    {
      return fail(Error::AttrMissingEq);
    }
    std::string_view name = detail::trim(_rest.substr(0, eq));
    if (name.empty())
    {
      return fail(Error::AttrInvalidName);
    }

    std::string_view value = detail::trimLeft(_rest.substr(eq + 1));
    if (value.empty())
    {
      return fail(Error::AttrMissingQuote);
    }
    char quote = value.front();
    if (quote != '"' && quote != '\'')
    {
      return fail(Error::AttrInvalidQuote);
    }
    std::size_t close = value.find(quote, 1);
    if (close == std::string_view::npos)
    {
      return fail(Error::AttrMissingEndQuote);
    }

    _current.name = name;
    _current.value = Text::escaped(value.substr(1, close - 1));
    _rest = value.substr(close + 1);
    return true;
  }

  /// \brief Pair produced by the last successful next().
  const Attribute &current() const { return _current; }

  /// \brief Error produced by the most recent next(), if any.
  std::optional<Error> error() const { return _error; }

  /// \brief Value of the first attribute called name.
  ///
  /// Scans a copy from the current position. Returns std::nullopt if the name is absent or a
  /// malformed pair is reached first. err, when given, receives the error that stopped the scan
  /// (std::nullopt if there was none).
  std::optional<Text> get(std::string_view name, std::optional<Error> *err = nullptr) const
  {
    Attrs copy = *this;
    while (copy.next())
    {
      if (copy.current().name == name)
      {
        if (err)
        {
          err->reset();
        }
        return copy.current().value;
      }
    }
    if (err)
    {
      *err = copy.error();
    }
    return std::nullopt;
  }

private:
  enum class State
  {
    Active,
    Exhausted
  };

  bool fail(Error error)
  {
    _rest = std::string_view{};
    _state = State::Exhausted;
    _error = error;
    return false;
  }

  std::string_view _rest{};
  State _state{State::Active};
  Attribute _current{};
  std::optional<Error> _error{};
};

inline bool operator==(const Attrs &lhs, const Attrs &rhs) { return lhs.raw() == rhs.raw(); }
inline bool operator!=(const Attrs &lhs, const Attrs &rhs) { return !(lhs == rhs); }

/// \brief Debug rendering as a map, e.g. `{a: "1", b: "2"}`.
inline std::ostream &operator<<(std::ostream &os, const Attrs &attrs)
{
  Attrs copy = attrs;
  os << '{';
  bool first = true;
  while (copy.next())
  {
    if (!first)
    {
      os << ", ";
    }
    first = false;
    os << copy.current().name << ": " << copy.current().value;
  }
  if (copy.error())
  {
    os << (first ? "" : ", ") << "<error: " << describe(*copy.error()) << '>';
  }
  return os << '}';
}

} // namespace xml
} // namespace parsers
} // namespace txml
