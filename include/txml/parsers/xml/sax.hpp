// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <txml/parsers/xml/scanner.hpp>

#include <functional>
#include <optional>
#include <string_view>

namespace txml
{
namespace parsers
{
namespace xml
{
/// \brief SAX-style callbacks (std::function). Register any subset; unregistered ones are skipped.
///
/// Callbacks receive borrowed views; copy anything that must outlive the input buffer.
struct SaxCallbacks
{
  std::function<void(std::string_view name, const Attrs &attrs)> onOpen;
  std::function<void(std::string_view name)> onClose; ///< Also fired after self-closing tags
  std::function<void(std::string_view name, std::string_view subset)> onDoctype;
  std::function<void(std::string_view content)> onPi;
  std::function<void(std::string_view content)> onComment;
  std::function<void(const Text &text)> onText; ///< CDATA arrives as verbatim text
};

/// \brief Drain the scanner and dispatch SAX callbacks.
/// \return The lexical error that ended the stream, or std::nullopt if the input was consumed.
inline std::optional<Error> runSax(Scanner &scanner, const SaxCallbacks &cb)
{
  while (scanner.next())
  {
    const Event &ev = scanner.current();
    switch (ev.kind)
    {
    case EventKind::Open:
      if (cb.onOpen)
      {
        cb.onOpen(ev.name, ev.attrs);
      }
      break;
    case EventKind::Close:
      if (cb.onClose)
      {
        cb.onClose(ev.name);
      }
      break;
    case EventKind::Doctype:
      if (cb.onDoctype)
      {
        cb.onDoctype(ev.name, ev.content);
      }
      break;
    case EventKind::Pi:
      if (cb.onPi)
      {
        cb.onPi(ev.content);
      }
      break;
    case EventKind::Comment:
      if (cb.onComment)
      {
        cb.onComment(ev.content);
      }
      break;
    case EventKind::Text:
      if (cb.onText)
      {
        cb.onText(ev.text);
      }
      break;
    }
  }
  return scanner.error();
}

} // namespace xml
} // namespace parsers
} // namespace txml
