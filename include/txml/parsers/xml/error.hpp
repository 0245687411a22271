// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <ostream>

namespace txml
{
namespace parsers
{
namespace xml
{
/// \brief Lexical defects reported by the scanner, the attribute decoder and the text decoder.
///
/// The set is closed and carries no position. Callers that need an offset compare the length of
/// Scanner::remaining() against the input they supplied.
enum class Error
{
  UnterminatedPi,
  UnterminatedComment,
  UnterminatedCdata,
  UnterminatedDoctype,
  UnterminatedDoctypeSubset,
  UnterminatedClosingTag,
  UnterminatedTag,
  InvalidTagName,
  AttrMissingEq,
  AttrInvalidName,
  AttrMissingQuote,
  AttrInvalidQuote,
  AttrMissingEndQuote,
  UnterminatedEntity,
  InvalidNamedEntity,
  InvalidNumericEntity
};

/// \brief Static, human-readable description of an error kind.
inline const char *describe(Error error)
{
  switch (error)
  {
  case Error::UnterminatedPi:
    return "unterminated processing instruction";
  case Error::UnterminatedComment:
    return "unterminated comment";
  case Error::UnterminatedCdata:
    return "unterminated CDATA section";
  case Error::UnterminatedDoctype:
    return "unterminated doctype";
  case Error::UnterminatedDoctypeSubset:
    return "unterminated doctype internal subset";
  case Error::UnterminatedClosingTag:
    return "unterminated closing tag";
  case Error::UnterminatedTag:
    return "unterminated tag";
  case Error::InvalidTagName:
    return "invalid tag name";
  case Error::AttrMissingEq:
    return "attribute is missing '='";
  case Error::AttrInvalidName:
    return "invalid attribute name";
  case Error::AttrMissingQuote:
    return "attribute value is missing an opening quote";
  case Error::AttrInvalidQuote:
    return "attribute value does not start with a quote character";
  case Error::AttrMissingEndQuote:
    return "attribute value is missing a closing quote";
  case Error::UnterminatedEntity:
    return "unterminated entity reference";
  case Error::InvalidNamedEntity:
    return "invalid named entity";
  case Error::InvalidNumericEntity:
    return "invalid numeric entity";
  }
  return "unknown error";
}

inline std::ostream &operator<<(std::ostream &os, Error error) { return os << describe(error); }

} // namespace xml
} // namespace parsers
} // namespace txml
