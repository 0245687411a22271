// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <txml/parsers/xml/attrs.hpp>
#include <txml/parsers/xml/error.hpp>
#include <txml/parsers/xml/text.hpp>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>

namespace txml
{
namespace parsers
{
namespace xml
{
/// \brief Event kinds produced by the scanner.
enum class EventKind
{
  Open,    ///< name, attrs
  Close,   ///< name; also emitted after a self-closing tag
  Doctype, ///< name, content = internal subset (may be empty)
  Pi,      ///< content between '<?' and '?>'
  Comment, ///< content between '<!--' and '-->'
  Text     ///< text
};

inline const char *toString(EventKind kind)
{
  switch (kind)
  {
  case EventKind::Open:
    return "Open";
  case EventKind::Close:
    return "Close";
  case EventKind::Doctype:
    return "Doctype";
  case EventKind::Pi:
    return "Pi";
  case EventKind::Comment:
    return "Comment";
  case EventKind::Text:
    return "Text";
  }
  return "Unknown";
}

/// \brief One lexical token. Every string member borrows from the scanner's input.
struct Event
{
  EventKind kind{EventKind::Text};
  std::string_view name;    ///< Open/Close tag name, Doctype name
  std::string_view content; ///< Pi/Comment content, Doctype internal subset
  Attrs attrs;              ///< Open only
  Text text;                ///< Text only

  static Event makeOpen(std::string_view name, Attrs attrs)
  {
    Event e;
    e.kind = EventKind::Open;
    e.name = name;
    e.attrs = attrs;
    return e;
  }

  static Event makeClose(std::string_view name)
  {
    Event e;
    e.kind = EventKind::Close;
    e.name = name;
    return e;
  }

  static Event makeDoctype(std::string_view name, std::string_view subset)
  {
    Event e;
    e.kind = EventKind::Doctype;
    e.name = name;
    e.content = subset;
    return e;
  }

  static Event makePi(std::string_view content)
  {
    Event e;
    e.kind = EventKind::Pi;
    e.content = content;
    return e;
  }

  static Event makeComment(std::string_view content)
  {
    Event e;
    e.kind = EventKind::Comment;
    e.content = content;
    return e;
  }

  static Event makeText(Text text)
  {
    Event e;
    e.kind = EventKind::Text;
    e.text = text;
    return e;
  }
};

/// \brief Structural equality; Text members compare by decoded content.
inline bool operator==(const Event &lhs, const Event &rhs)
{
  if (lhs.kind != rhs.kind)
  {
    return false;
  }
  switch (lhs.kind)
  {
  case EventKind::Open:
    return lhs.name == rhs.name && lhs.attrs == rhs.attrs;
  case EventKind::Close:
    return lhs.name == rhs.name;
  case EventKind::Doctype:
    return lhs.name == rhs.name && lhs.content == rhs.content;
  case EventKind::Pi:
  case EventKind::Comment:
    return lhs.content == rhs.content;
  case EventKind::Text:
    return lhs.text == rhs.text;
  }
  return false;
}

inline bool operator!=(const Event &lhs, const Event &rhs) { return !(lhs == rhs); }

inline std::ostream &operator<<(std::ostream &os, const Event &event)
{
  os << toString(event.kind) << '(';
  switch (event.kind)
  {
  case EventKind::Open:
    os << Text::verbatim(event.name) << ", " << event.attrs;
    break;
  case EventKind::Close:
    os << Text::verbatim(event.name);
    break;
  case EventKind::Doctype:
    os << Text::verbatim(event.name) << ", " << Text::verbatim(event.content);
    break;
  case EventKind::Pi:
  case EventKind::Comment:
    os << Text::verbatim(event.content);
    break;
  case EventKind::Text:
    os << (event.text.mode() == TextMode::Verbatim ? "Verbatim " : "Escaped ") << event.text;
    break;
  }
  return os << ')';
}

/// \brief Pull scanner: turns an in-memory buffer into a sequence of lexical events.
///
/// Non-validating and allocation-free. Open/close names are not matched, attributes are not
/// decoded until the caller walks an event's Attrs, and entities are not resolved until the
/// caller walks a Text. The buffer must outlive the scanner and every event taken from it.
///
/// The stream yields at most one error. The call that reports it returns false with error()
/// set; the scanner has then discarded its remaining input and every later call returns false
/// with no error.
///
/// \code
/// txml::parsers::xml::Scanner scanner(doc);
/// while (scanner.next())
/// {
///   const auto &ev = scanner.current();
///   // ...
/// }
/// if (scanner.error()) { /* handle */ }
/// \endcode
class Scanner
{
public:
  explicit Scanner(std::string_view input) : _rest(input) {}

  /// \brief Event produced by the last successful next().
  const Event &current() const { return _event; }

  /// \brief Error produced by the most recent next(), if any.
  std::optional<Error> error() const { return _error; }

  /// \brief Input not yet consumed. `input.size() - remaining().size()` is the byte offset of
  /// the next event.
  std::string_view remaining() const { return _rest; }

  bool exhausted() const
  {
    return !_pendingClose && (_state == State::Exhausted || _rest.empty());
  }

  /// \brief Advance to the next event. Returns false on error or at the end of the input.
  bool next()
  {
    _error.reset();
    if (_pendingClose)
    {
      _event = Event::makeClose(*_pendingClose);
      _pendingClose.reset();
      return true;
    }
    if (_state == State::Exhausted)
    {
      return false;
    }
    if (_rest.empty())
    {
      _state = State::Exhausted;
      return false;
    }

    if (consume("<?"))
    {
      return readDelimited("?>", EventKind::Pi, Error::UnterminatedPi);
    }
    if (consume("<!--"))
    {
      return readDelimited("-->", EventKind::Comment, Error::UnterminatedComment);
    }
    if (consume("<![CDATA["))
    {
      return readDelimited("]]>", EventKind::Text, Error::UnterminatedCdata);
    }
    if (consume("<!DOCTYPE"))
    {
      return readDoctype();
    }
    if (consume("</"))
    {
      return readClosingTag();
    }
    if (consume("<"))
    {
      return readTag();
    }
    if (_rest.front() == '&')
    {
      return readReferenceRun();
    }
    return readVerbatimRun();
  }

private:
  enum class State
  {
    Active,
    Exhausted
  };

  bool consume(std::string_view prefix)
  {
    if (_rest.compare(0, prefix.size(), prefix) == 0)
    {
      _rest.remove_prefix(prefix.size());
      return true;
    }
    return false;
  }

  /// Position of the first character of delims in s that is not inside a '...' or "..." span.
  static std::size_t findUnquoted(std::string_view s, std::string_view delims)
  {
    char quote = '\0';
    for (std::size_t i = 0; i < s.size(); ++i)
    {
      char ch = s[i];
      if (quote != '\0')
      {
        if (ch == quote)
        {
          quote = '\0';
        }
      }
      else if (ch == '"' || ch == '\'')
      {
        quote = ch;
      }
      else if (delims.find(ch) != std::string_view::npos)
      {
        return i;
      }
    }
    return std::string_view::npos;
  }

  bool readDelimited(std::string_view terminator, EventKind kind, Error unterminated)
  {
    std::size_t end = _rest.find(terminator);
    if (end == std::string_view::npos)
    {
      return fail(unterminated);
    }
    std::string_view body = _rest.substr(0, end);
    _rest.remove_prefix(end + terminator.size());

    switch (kind)
    {
    case EventKind::Pi:
      _event = Event::makePi(body);
      break;
    case EventKind::Comment:
      _event = Event::makeComment(body);
      break;
    case EventKind::Text:
      _event = Event::makeText(Text::verbatim(body));
      break;
    case EventKind::Open:
    case EventKind::Close:
    case EventKind::Doctype:
      return fail(unterminated);
    }
    return true;
  }

  bool readDoctype()
  {
    std::size_t stop = findUnquoted(_rest, "[>");
    if (stop == std::string_view::npos)
    {
      return fail(Error::UnterminatedDoctype);
    }
    std::string_view name = detail::trim(_rest.substr(0, stop));
    if (_rest[stop] == '>')
    {
      _rest.remove_prefix(stop + 1);
      _event = Event::makeDoctype(name, std::string_view{});
      return true;
    }

    std::string_view subset = _rest.substr(stop + 1);
    std::size_t close = findUnquoted(subset, "]");
    if (close == std::string_view::npos)
    {
      return fail(Error::UnterminatedDoctypeSubset);
    }
    std::string_view tail = detail::trimLeft(subset.substr(close + 1));
    if (tail.empty() || tail.front() != '>')
    {
      return fail(Error::UnterminatedDoctype);
    }
    _rest = tail.substr(1);
    _event = Event::makeDoctype(name, detail::trim(subset.substr(0, close)));
    return true;
  }

  bool readClosingTag()
  {
    std::size_t end = _rest.find('>');
    if (end == std::string_view::npos)
    {
      return fail(Error::UnterminatedClosingTag);
    }
    std::string_view name = detail::trim(_rest.substr(0, end));
    if (name.empty())
    {
      return fail(Error::InvalidTagName);
    }
    _rest.remove_prefix(end + 1);
    _event = Event::makeClose(name);
    return true;
  }

  bool readTag()
  {
    std::size_t end = findUnquoted(_rest, ">");
    if (end == std::string_view::npos)
    {
      // An unbalanced quote: end at the first '>' so Attrs can report the open quote.
      end = _rest.find('>');
    }
    if (end == std::string_view::npos)
    {
      return fail(Error::UnterminatedTag);
    }
    std::string_view inner = _rest.substr(0, end);

    std::size_t nameEnd = 0;
    while (nameEnd < inner.size() && !detail::isSpace(inner[nameEnd]) && inner[nameEnd] != '/')
    {
      ++nameEnd;
    }
    std::string_view name = inner.substr(0, nameEnd);
    if (name.empty())
    {
      return fail(Error::InvalidTagName);
    }
    _rest.remove_prefix(end + 1);

    std::string_view attrText = detail::trim(inner.substr(nameEnd));
    if (!attrText.empty() && attrText.back() == '/')
    {
      attrText.remove_suffix(1);
      attrText = detail::trimRight(attrText);
      _pendingClose = name;
    }
    _event = Event::makeOpen(name, Attrs(attrText));
    return true;
  }

  // A run starting with '&': up to and including the first ';' before the next '<'. Without
  // such a ';' the whole run up to '<' is kept; the decoder reports the malformed reference.
  bool readReferenceRun()
  {
    std::size_t lt = _rest.find('<');
    std::size_t semi = _rest.find(';');
    std::size_t end = 0;
    if (semi != std::string_view::npos && (lt == std::string_view::npos || semi < lt))
    {
      end = semi + 1;
    }
    else
    {
      end = lt == std::string_view::npos ? _rest.size() : lt;
    }
    _event = Event::makeText(Text::escaped(_rest.substr(0, end)));
    _rest.remove_prefix(end);
    return true;
  }

  bool readVerbatimRun()
  {
    std::size_t end = _rest.find_first_of("<&");
    if (end == std::string_view::npos)
    {
      end = _rest.size();
    }
    _event = Event::makeText(Text::verbatim(_rest.substr(0, end)));
    _rest.remove_prefix(end);
    return true;
  }

  bool fail(Error error)
  {
    _rest = std::string_view{};
    _pendingClose.reset();
    _state = State::Exhausted;
    _error = error;
    return false;
  }

  std::string_view _rest;
  std::optional<std::string_view> _pendingClose{};
  State _state{State::Active};
  Event _event{};
  std::optional<Error> _error{};
};

} // namespace xml
} // namespace parsers
} // namespace txml
