#pragma once
/// \file xml.hpp
/// \brief Streaming, non-validating, allocation-free XML tokenizer for C++17.
///
/// Design goals:
///  - Header-only, zero external deps
///  - Every value handed out is a std::string_view into the caller's buffer; nothing is copied
///  - Attributes and entity references are decoded lazily, only when the caller asks
///  - Closed set of lexical errors; each lazy sequence reports at most one, then ends
///  - No structure checks: matching tags, duplicate attributes and DTDs are the caller's business
///
/// Example:
/// \code
/// std::string doc = "<root a=\"1\">hi &amp; bye</root>";
/// txml::parsers::xml::Scanner scanner(doc);
/// while (scanner.next())
/// {
///   const auto &ev = scanner.current();
///   if (ev.kind == txml::parsers::xml::EventKind::Open)
///   {
///     auto a = ev.attrs.get("a");
///   }
/// }
/// if (scanner.error()) { /* handle */ }
/// \endcode
///
/// SPDX-License-Identifier: MPL-2.0

#ifndef TXML_XML_ENABLE_SAX
#define TXML_XML_ENABLE_SAX 1
#endif

#include <txml/parsers/xml/attrs.hpp>
#include <txml/parsers/xml/error.hpp>
#include <txml/parsers/xml/scanner.hpp>
#include <txml/parsers/xml/text.hpp>

#if TXML_XML_ENABLE_SAX
#include <txml/parsers/xml/sax.hpp>
#endif
