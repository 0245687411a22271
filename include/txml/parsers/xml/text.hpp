// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <txml/parsers/xml/error.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace txml
{
namespace parsers
{
namespace xml
{
namespace detail
{
  inline bool isSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }

  inline std::string_view trimLeft(std::string_view s)
  {
    while (!s.empty() && isSpace(s.front()))
    {
      s.remove_prefix(1);
    }
    return s;
  }

  inline std::string_view trimRight(std::string_view s)
  {
    while (!s.empty() && isSpace(s.back()))
    {
      s.remove_suffix(1);
    }
    return s;
  }

  inline std::string_view trim(std::string_view s) { return trimRight(trimLeft(s)); }

  constexpr char32_t kReplacementChar = 0xFFFD;

  /// \brief Decode one scalar value from the front of a UTF-8 slice.
  ///
  /// \param s Non-empty slice.
  /// \param len Receives the number of bytes consumed (always at least 1).
  /// \return The scalar, or U+FFFD for an ill-formed sequence (len is then 1).
  inline char32_t decodeUtf8(std::string_view s, std::size_t &len)
  {
    const auto b0 = static_cast<unsigned char>(s[0]);
    len = 1;
    if (b0 < 0x80u)
    {
      return b0;
    }

    std::size_t need = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((b0 & 0xE0u) == 0xC0u)
    {
      need = 1;
      cp = b0 & 0x1Fu;
      min = 0x80;
    }
    else if ((b0 & 0xF0u) == 0xE0u)
    {
      need = 2;
      cp = b0 & 0x0Fu;
      min = 0x800;
    }
    else if ((b0 & 0xF8u) == 0xF0u)
    {
      need = 3;
      cp = b0 & 0x07u;
      min = 0x10000;
    }
    else
    {
      return kReplacementChar;
    }

    if (s.size() <= need)
    {
      return kReplacementChar;
    }
    for (std::size_t i = 1; i <= need; ++i)
    {
      const auto b = static_cast<unsigned char>(s[i]);
      if ((b & 0xC0u) != 0x80u)
      {
        return kReplacementChar;
      }
      cp = (cp << 6) | (b & 0x3Fu);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    {
      return kReplacementChar;
    }
    len = need + 1;
    return cp;
  }

  /// \brief Append a scalar value to out as UTF-8.
  inline void appendUtf8(char32_t cp, std::string &out)
  {
    if (cp <= 0x7Fu)
    {
      out.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FFu)
    {
      out.push_back(static_cast<char>(0xC0u | ((cp >> 6) & 0x1Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else if (cp <= 0xFFFFu)
    {
      out.push_back(static_cast<char>(0xE0u | ((cp >> 12) & 0x0Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
    else
    {
      out.push_back(static_cast<char>(0xF0u | ((cp >> 18) & 0x07u)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
      out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
  }

  inline std::uint32_t digitValue(char c)
  {
    if (c >= '0' && c <= '9')
    {
      return static_cast<std::uint32_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
      return static_cast<std::uint32_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F')
    {
      return static_cast<std::uint32_t>(c - 'A' + 10);
    }
    return 0xFFu;
  }
} // namespace detail

/// \brief How a Text slice is interpreted.
enum class TextMode
{
  Verbatim, ///< Characters pass through unchanged (CDATA, plain runs)
  Escaped   ///< '&...;' references are resolved while iterating
};

/// \brief Lazily decoded character data borrowed from the input buffer.
///
/// Text is a cursor: next() consumes one character from the front of the slice. Copies are
/// independent, so a Text taken from an event can be decoded any number of times by copying it
/// first. The buffer must outlive every copy.
///
/// \code
/// Text t = Text::escaped("a &lt; b");
/// while (t.next())
/// {
///   use(t.current());
/// }
/// if (t.error()) { /* malformed entity */ }
/// \endcode
class Text
{
public:
  Text() = default;

  static Text verbatim(std::string_view slice) { return Text(TextMode::Verbatim, slice); }
  static Text escaped(std::string_view slice) { return Text(TextMode::Escaped, slice); }

  TextMode mode() const { return _mode; }

  /// \brief The part of the slice not yet decoded.
  std::string_view raw() const { return _rest; }

  bool exhausted() const { return _state == State::Exhausted || _rest.empty(); }

  /// \brief Advance to the next decoded character.
  /// \return false at the end of the slice or on a decode error; error() tells which. After an
  /// error the slice is cleared and later calls return false with no error.
  bool next()
  {
    _error.reset();
    if (_state == State::Exhausted)
    {
      return false;
    }
    if (_rest.empty())
    {
      _state = State::Exhausted;
      return false;
    }
    if (_mode == TextMode::Escaped && _rest.front() == '&')
    {
      return decodeReference();
    }
    std::size_t len = 0;
    _current = detail::decodeUtf8(_rest, len);
    _rest.remove_prefix(len);
    return true;
  }

  /// \brief Character produced by the last successful next().
  char32_t current() const { return _current; }

  /// \brief Error produced by the most recent next(), if any.
  std::optional<Error> error() const { return _error; }

  /// \brief Decode a copy of this text and append it to out as UTF-8.
  /// \return false if decoding failed; err receives the reason. Characters decoded before the
  /// failure are still appended.
  bool appendUtf8(std::string &out, Error *err = nullptr) const
  {
    Text copy = *this;
    while (copy.next())
    {
      detail::appendUtf8(copy.current(), out);
    }
    if (copy.error())
    {
      if (err)
      {
        *err = *copy.error();
      }
      return false;
    }
    return true;
  }

  /// \brief Element-wise comparison of two fully decoded sequences, working on copies.
  /// A decode error on either side makes the sequences unequal.
  static bool sameSequence(Text lhs, Text rhs)
  {
    while (true)
    {
      const bool l = lhs.next();
      const bool r = rhs.next();
      if (!l || !r)
      {
        return !l && !r && !lhs.error() && !rhs.error();
      }
      if (lhs.current() != rhs.current())
      {
        return false;
      }
    }
  }

private:
  enum class State
  {
    Active,
    Exhausted
  };

  Text(TextMode mode, std::string_view slice) : _mode(mode), _rest(slice) {}

  bool decodeReference()
  {
    std::size_t semi = _rest.find(';');
    if (semi == std::string_view::npos)
    {
      return fail(Error::UnterminatedEntity);
    }
    std::string_view name = _rest.substr(1, semi - 1);
    _rest.remove_prefix(semi + 1);

    if (name == "lt")
    {
      _current = U'<';
    }
    else if (name == "gt")
    {
      _current = U'>';
    }
    else if (name == "amp")
    {
      _current = U'&';
    }
    else if (name == "apos")
    {
      _current = U'\'';
    }
    else if (name == "quot")
    {
      _current = U'"';
    }
    else if (!name.empty() && name.front() == '#')
    {
      if (!parseCharRef(name.substr(1), _current))
      {
        return fail(Error::InvalidNumericEntity);
      }
    }
    else
    {
      return fail(Error::InvalidNamedEntity);
    }
    return true;
  }

  // body is the reference without '&', '#' and ';', e.g. "60" or "x3E".
  static bool parseCharRef(std::string_view body, char32_t &out)
  {
    std::uint32_t radix = 10;
    if (!body.empty() && (body.front() == 'x' || body.front() == 'X'))
    {
      radix = 16;
      body.remove_prefix(1);
    }
    if (body.empty())
    {
      return false;
    }
    std::uint32_t code = 0;
    for (char c : body)
    {
      std::uint32_t v = detail::digitValue(c);
      if (v >= radix)
      {
        return false;
      }
      if (code > (UINT32_MAX - v) / radix)
      {
        return false;
      }
      code = code * radix + v;
    }
    if (code > 0x10FFFFu || (code >= 0xD800u && code <= 0xDFFFu))
    {
      return false;
    }
    out = static_cast<char32_t>(code);
    return true;
  }

  bool fail(Error error)
  {
    _rest = std::string_view{};
    _state = State::Exhausted;
    _error = error;
    return false;
  }

  TextMode _mode{TextMode::Verbatim};
  std::string_view _rest{};
  State _state{State::Active};
  char32_t _current{0};
  std::optional<Error> _error{};
};

inline bool operator==(const Text &lhs, const Text &rhs) { return Text::sameSequence(lhs, rhs); }
inline bool operator!=(const Text &lhs, const Text &rhs) { return !(lhs == rhs); }

inline bool operator==(const Text &lhs, std::string_view rhs)
{
  return Text::sameSequence(lhs, Text::verbatim(rhs));
}
inline bool operator==(std::string_view lhs, const Text &rhs) { return rhs == lhs; }
inline bool operator!=(const Text &lhs, std::string_view rhs) { return !(lhs == rhs); }
inline bool operator!=(std::string_view lhs, const Text &rhs) { return !(rhs == lhs); }

/// \brief Debug rendering: the decoded text in double quotes, with a trailing error marker when
/// decoding fails part way.
inline std::ostream &operator<<(std::ostream &os, const Text &text)
{
  static const char *hex = "0123456789abcdef";
  std::string out;
  out.push_back('"');
  Text copy = text;
  while (copy.next())
  {
    char32_t c = copy.current();
    switch (c)
    {
    case U'"':
      out += "\\\"";
      break;
    case U'\\':
      out += "\\\\";
      break;
    case U'\n':
      out += "\\n";
      break;
    case U'\r':
      out += "\\r";
      break;
    case U'\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20)
      {
        out += "\\u{";
        out.push_back(hex[(c >> 4) & 0xF]);
        out.push_back(hex[c & 0xF]);
        out.push_back('}');
      }
      else
      {
        detail::appendUtf8(c, out);
      }
    }
  }
  out.push_back('"');
  os << out;
  if (copy.error())
  {
    os << " <error: " << describe(*copy.error()) << '>';
  }
  return os;
}

} // namespace xml
} // namespace parsers
} // namespace txml
