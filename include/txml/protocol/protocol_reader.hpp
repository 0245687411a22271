// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <txml/core/logger.hpp>
#include <txml/parsers/xml.hpp>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace txml
{
namespace protocol
{
/// \brief Wire type of a message argument.
enum class ArgKind
{
  NewId,
  Int,
  Uint,
  Fixed,
  String,
  Object,
  Array,
  Fd
};

inline const char *toString(ArgKind kind)
{
  switch (kind)
  {
  case ArgKind::NewId:
    return "new_id";
  case ArgKind::Int:
    return "int";
  case ArgKind::Uint:
    return "uint";
  case ArgKind::Fixed:
    return "fixed";
  case ArgKind::String:
    return "string";
  case ArgKind::Object:
    return "object";
  case ArgKind::Array:
    return "array";
  case ArgKind::Fd:
    return "fd";
  }
  return "unknown";
}

inline std::optional<ArgKind> argKindFromString(std::string_view name)
{
  static constexpr ArgKind kAll[] = {ArgKind::NewId,  ArgKind::Int,    ArgKind::Uint,
                                     ArgKind::Fixed,  ArgKind::String, ArgKind::Object,
                                     ArgKind::Array,  ArgKind::Fd};
  for (ArgKind kind : kAll)
  {
    if (name == toString(kind))
    {
      return kind;
    }
  }
  return std::nullopt;
}

struct Description
{
  std::string summary;
  std::string body;
};

struct Arg
{
  std::string name;
  ArgKind kind{ArgKind::NewId};
  std::optional<std::string> summary;
  std::optional<std::string> interface;
  bool allowNull{false};
  std::optional<std::string> enumeration;
  std::optional<Description> description;
};

/// \brief A request or an event.
struct Message
{
  std::string name;
  bool destructor{false};
  std::uint32_t since{1};
  std::optional<std::uint32_t> deprecatedSince;
  std::optional<Description> description;
  std::vector<Arg> args;
};

struct Entry
{
  std::string name;
  std::uint32_t value{0};
  std::optional<std::string> summary;
  std::uint32_t since{1};
  std::optional<std::uint32_t> deprecatedSince;
  std::optional<Description> description;
};

struct Enum
{
  std::string name;
  std::uint32_t since{1};
  bool bitfield{false};
  std::optional<Description> description;
  std::optional<std::uint32_t> deprecatedSince;
  std::vector<Entry> entries;
};

struct Interface
{
  std::string name;
  std::uint32_t version{0};
  std::optional<Description> description;
  std::vector<Message> requests;
  std::vector<Message> events;
  std::vector<Enum> enums;
};

struct Protocol
{
  std::string name;
  std::string copyright;
  std::optional<Description> description;
  std::vector<Interface> interfaces;
};

/// \brief Result of a non-throwing read.
struct ReadResult
{
  Protocol protocol;                                 ///< Undefined if ok == false
  bool ok{false};                                    ///< True if the document was read
  std::string message;                               ///< Failure reason when ok == false
  std::optional<parsers::xml::Error> lexical;        ///< Set when the failure was lexical
  std::size_t offset{0};                             ///< Start of the construct that failed
};

/// \brief Maps a protocol-schema document onto the structs above.
///
/// Built on the event stream: the scanner only tokenizes, so tag matching, required attributes
/// and content models are checked here. Owned strings are produced, so the result does not
/// borrow from the document.
class ProtocolReader
{
public:
  static ReadResult read(std::string_view document)
  {
    ProtocolReader reader(document);
    reader.run();
    if (reader._result.ok)
    {
      TXML_LOG_DEBUG("protocol: read '" << reader._result.protocol.name << "' with "
                                         << reader._result.protocol.interfaces.size()
                                         << " interface(s)");
    }
    else
    {
      TXML_LOG_DEBUG("protocol: read failed at byte " << reader._result.offset << ": "
                                                       << reader._result.message);
    }
    return std::move(reader._result);
  }

  /// \throws std::runtime_error describing the failure and its byte offset.
  static Protocol readOrThrow(std::string_view document)
  {
    ReadResult result = read(document);
    if (!result.ok)
    {
      throw std::runtime_error("protocol: " + result.message + " (at byte " +
                               std::to_string(result.offset) + ")");
    }
    return std::move(result.protocol);
  }

private:
  using Attrs = parsers::xml::Attrs;
  using Event = parsers::xml::Event;
  using EventKind = parsers::xml::EventKind;
  using Text = parsers::xml::Text;

  explicit ProtocolReader(std::string_view document) : _document(document), _scanner(document)
  {
  }

  void run()
  {
    while (pull())
    {
      const Event &ev = _scanner.current();
      if (ev.kind == EventKind::Open && ev.name == "protocol")
      {
        Attrs attrs = ev.attrs;
        _result.ok = readProtocol(attrs, _result.protocol);
        return;
      }
    }
    if (_scanner.error())
    {
      failLexical(*_scanner.error(), "document");
    }
    else
    {
      fail("no <protocol> element found");
    }
  }

  // ===== Failure bookkeeping =====

  bool fail(const std::string &message)
  {
    _result.ok = false;
    _result.message = message;
    _result.offset = _eventOffset;
    return false;
  }

  bool failLexical(parsers::xml::Error error, const std::string &where)
  {
    _result.lexical = error;
    return fail(where + ": " + parsers::xml::describe(error));
  }

  bool unexpected(std::string_view parent, std::string_view child)
  {
    return fail("unexpected <" + std::string(child) + "> inside <" + std::string(parent) + ">");
  }

  // ===== Event walking =====

  /// Advance the scanner, remembering where the event about to be read starts.
  bool pull()
  {
    _eventOffset = _document.size() - _scanner.remaining().size();
    return _scanner.next();
  }

  bool nextEvent()
  {
    if (pull())
    {
      return true;
    }
    if (_scanner.error())
    {
      return failLexical(*_scanner.error(), "document");
    }
    return fail("unexpected end of document");
  }

  /// Walk the content of element until its closing tag. onChild receives each child element;
  /// onText each text run. Comments, PIs and doctypes are skipped.
  template <typename OnChild, typename OnText>
  bool readContent(std::string_view element, OnChild &&onChild, OnText &&onText)
  {
    while (nextEvent())
    {
      // Copy: child readers advance the scanner.
      const Event ev = _scanner.current();
      switch (ev.kind)
      {
      case EventKind::Open:
        if (!onChild(ev.name, ev.attrs))
        {
          return false;
        }
        break;
      case EventKind::Close:
        if (ev.name != element)
        {
          return fail("mismatched closing tag </" + std::string(ev.name) + ">, expected </" +
                      std::string(element) + ">");
        }
        return true;
      case EventKind::Text:
        if (!onText(ev.text))
        {
          return false;
        }
        break;
      case EventKind::Doctype:
      case EventKind::Pi:
      case EventKind::Comment:
        break;
      }
    }
    return false;
  }

  template <typename OnChild> bool readElements(std::string_view element, OnChild &&onChild)
  {
    return readContent(element, std::forward<OnChild>(onChild), [](const Text &) { return true; });
  }

  /// Text-only element: decoded text runs are appended to out, child elements are rejected.
  bool readBody(std::string_view element, std::string &out)
  {
    return readContent(
      element, [&](std::string_view child, const Attrs &) { return unexpected(element, child); },
      [&](const Text &text) { return appendText(text, element, out); });
  }

  bool appendText(const Text &text, std::string_view element, std::string &out)
  {
    parsers::xml::Error err{};
    if (!text.appendUtf8(out, &err))
    {
      return failLexical(err, "text of <" + std::string(element) + ">");
    }
    return true;
  }

  // ===== Attributes =====

  bool attr(const Attrs &attrs, std::string_view element, std::string_view name,
            std::optional<std::string> &out)
  {
    std::optional<parsers::xml::Error> err;
    std::optional<Text> value = attrs.get(name, &err);
    if (err)
    {
      return failLexical(*err, "attributes of <" + std::string(element) + ">");
    }
    out.reset();
    if (!value)
    {
      return true;
    }
    std::string decoded;
    if (!appendText(*value, element, decoded))
    {
      return false;
    }
    out = std::move(decoded);
    return true;
  }

  bool required(const Attrs &attrs, std::string_view element, std::string_view name,
                std::string &out)
  {
    std::optional<std::string> value;
    if (!attr(attrs, element, name, value))
    {
      return false;
    }
    if (!value)
    {
      return fail("<" + std::string(element) + "> is missing required attribute '" +
                  std::string(name) + "'");
    }
    out = std::move(*value);
    return true;
  }

  static bool parseUnsigned(std::string_view text, bool allowHex, std::uint32_t &out)
  {
    int base = 10;
    if (allowHex && text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    {
      base = 16;
      text.remove_prefix(2);
    }
    if (text.empty())
    {
      return false;
    }
    const char *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out, base);
    return ec == std::errc() && ptr == end;
  }

  bool number(const Attrs &attrs, std::string_view element, std::string_view name,
              bool allowHex, std::optional<std::uint32_t> &out)
  {
    std::optional<std::string> value;
    if (!attr(attrs, element, name, value))
    {
      return false;
    }
    out.reset();
    if (!value)
    {
      return true;
    }
    std::uint32_t parsed = 0;
    if (!parseUnsigned(*value, allowHex, parsed))
    {
      return fail("<" + std::string(element) + "> attribute '" + std::string(name) +
                  "' is not a valid number: '" + *value + "'");
    }
    out = parsed;
    return true;
  }

  bool numberOr(const Attrs &attrs, std::string_view element, std::string_view name,
                std::uint32_t fallback, std::uint32_t &out)
  {
    std::optional<std::uint32_t> value;
    if (!number(attrs, element, name, false, value))
    {
      return false;
    }
    out = value.value_or(fallback);
    return true;
  }

  bool flag(const Attrs &attrs, std::string_view element, std::string_view name, bool &out)
  {
    std::optional<std::string> value;
    if (!attr(attrs, element, name, value))
    {
      return false;
    }
    if (!value || *value == "false")
    {
      out = false;
      return true;
    }
    if (*value == "true")
    {
      out = true;
      return true;
    }
    return fail("<" + std::string(element) + "> attribute '" + std::string(name) +
                "' must be 'true' or 'false', got '" + *value + "'");
  }

  // ===== Elements =====

  bool readProtocol(const Attrs &attrs, Protocol &protocol)
  {
    if (!required(attrs, "protocol", "name", protocol.name))
    {
      return false;
    }
    return readElements("protocol",
                        [&](std::string_view child, const Attrs &childAttrs)
                        {
                          if (child == "copyright")
                          {
                            return readBody("copyright", protocol.copyright);
                          }
                          if (child == "description")
                          {
                            return readDescription(childAttrs, protocol.description);
                          }
                          if (child == "interface")
                          {
                            protocol.interfaces.emplace_back();
                            return readInterface(childAttrs, protocol.interfaces.back());
                          }
                          return unexpected("protocol", child);
                        });
  }

  bool readDescription(const Attrs &attrs, std::optional<Description> &out)
  {
    Description description;
    if (!required(attrs, "description", "summary", description.summary) ||
        !readBody("description", description.body))
    {
      return false;
    }
    out = std::move(description);
    return true;
  }

  bool readInterface(const Attrs &attrs, Interface &interface)
  {
    std::optional<std::uint32_t> version;
    if (!required(attrs, "interface", "name", interface.name) ||
        !number(attrs, "interface", "version", false, version))
    {
      return false;
    }
    if (!version)
    {
      return fail("<interface> is missing required attribute 'version'");
    }
    interface.version = *version;

    bool ok = readElements("interface",
                           [&](std::string_view child, const Attrs &childAttrs)
                           {
                             if (child == "description")
                             {
                               return readDescription(childAttrs, interface.description);
                             }
                             if (child == "request" || child == "event")
                             {
                               auto &list = child == "request" ? interface.requests
                                                               : interface.events;
                               list.emplace_back();
                               return readMessage(child, childAttrs, list.back());
                             }
                             if (child == "enum")
                             {
                               interface.enums.emplace_back();
                               return readEnum(childAttrs, interface.enums.back());
                             }
                             return unexpected("interface", child);
                           });
    if (ok)
    {
      TXML_LOG_TRACE("protocol: interface '" << interface.name << "' v" << interface.version
                                              << ": " << interface.requests.size()
                                              << " request(s), " << interface.events.size()
                                              << " event(s), " << interface.enums.size()
                                              << " enum(s)");
    }
    return ok;
  }

  bool readMessage(std::string_view element, const Attrs &attrs, Message &message)
  {
    std::optional<std::string> type;
    if (!required(attrs, element, "name", message.name) || !attr(attrs, element, "type", type) ||
        !numberOr(attrs, element, "since", 1, message.since) ||
        !number(attrs, element, "deprecated-since", false, message.deprecatedSince))
    {
      return false;
    }
    message.destructor = type && *type == "destructor";

    return readElements(element,
                        [&](std::string_view child, const Attrs &childAttrs)
                        {
                          if (child == "description")
                          {
                            return readDescription(childAttrs, message.description);
                          }
                          if (child == "arg")
                          {
                            message.args.emplace_back();
                            return readArg(childAttrs, message.args.back());
                          }
                          return unexpected(element, child);
                        });
  }

  bool readArg(const Attrs &attrs, Arg &arg)
  {
    std::string type;
    if (!required(attrs, "arg", "name", arg.name) || !required(attrs, "arg", "type", type) ||
        !attr(attrs, "arg", "summary", arg.summary) ||
        !attr(attrs, "arg", "interface", arg.interface) ||
        !flag(attrs, "arg", "allow-null", arg.allowNull) ||
        !attr(attrs, "arg", "enum", arg.enumeration))
    {
      return false;
    }
    std::optional<ArgKind> kind = argKindFromString(type);
    if (!kind)
    {
      return fail("<arg> '" + arg.name + "' has unknown type '" + type + "'");
    }
    arg.kind = *kind;

    return readElements("arg",
                        [&](std::string_view child, const Attrs &childAttrs)
                        {
                          if (child == "description")
                          {
                            return readDescription(childAttrs, arg.description);
                          }
                          return unexpected("arg", child);
                        });
  }

  bool readEnum(const Attrs &attrs, Enum &enumeration)
  {
    if (!required(attrs, "enum", "name", enumeration.name) ||
        !numberOr(attrs, "enum", "since", 1, enumeration.since) ||
        !number(attrs, "enum", "deprecated-since", false, enumeration.deprecatedSince) ||
        !flag(attrs, "enum", "bitfield", enumeration.bitfield))
    {
      return false;
    }

    return readElements("enum",
                        [&](std::string_view child, const Attrs &childAttrs)
                        {
                          if (child == "description")
                          {
                            return readDescription(childAttrs, enumeration.description);
                          }
                          if (child == "entry")
                          {
                            enumeration.entries.emplace_back();
                            return readEntry(childAttrs, enumeration.entries.back());
                          }
                          return unexpected("enum", child);
                        });
  }

  bool readEntry(const Attrs &attrs, Entry &entry)
  {
    std::optional<std::uint32_t> value;
    if (!required(attrs, "entry", "name", entry.name) ||
        !number(attrs, "entry", "value", true, value) ||
        !attr(attrs, "entry", "summary", entry.summary) ||
        !numberOr(attrs, "entry", "since", 1, entry.since) ||
        !number(attrs, "entry", "deprecated-since", false, entry.deprecatedSince))
    {
      return false;
    }
    if (!value)
    {
      return fail("<entry> is missing required attribute 'value'");
    }
    entry.value = *value;

    return readElements("entry",
                        [&](std::string_view child, const Attrs &childAttrs)
                        {
                          if (child == "description")
                          {
                            return readDescription(childAttrs, entry.description);
                          }
                          return unexpected("entry", child);
                        });
  }

  std::string_view _document;
  parsers::xml::Scanner _scanner;
  std::size_t _eventOffset{0};
  ReadResult _result;
};

/// \brief Human-readable outline of a protocol, one line per interface, message and enum.
inline void writeSummary(std::ostream &os, const Protocol &protocol)
{
  os << "protocol " << protocol.name << '\n';
  for (const auto &iface : protocol.interfaces)
  {
    os << "  interface " << iface.name << " v" << iface.version << '\n';
    auto writeMessages = [&](const char *label, const std::vector<Message> &messages)
    {
      for (const auto &msg : messages)
      {
        os << "    " << label << ' ' << msg.name << '(';
        for (std::size_t i = 0; i < msg.args.size(); ++i)
        {
          const Arg &arg = msg.args[i];
          os << (i ? ", " : "") << toString(arg.kind);
          if (arg.interface)
          {
            os << '<' << *arg.interface << '>';
          }
          if (arg.allowNull)
          {
            os << '?';
          }
          os << ' ' << arg.name;
        }
        os << ')';
        if (msg.destructor)
        {
          os << " destructor";
        }
        if (msg.since != 1)
        {
          os << " since " << msg.since;
        }
        if (msg.deprecatedSince)
        {
          os << " deprecated since " << *msg.deprecatedSince;
        }
        os << '\n';
      }
    };
    writeMessages("request", iface.requests);
    writeMessages("event", iface.events);
    for (const auto &en : iface.enums)
    {
      os << "    enum " << en.name << (en.bitfield ? " (bitfield)" : "") << '\n';
      for (const auto &entry : en.entries)
      {
        os << "      " << entry.name << " = " << entry.value << '\n';
      }
    }
  }
}

} // namespace protocol
} // namespace txml
