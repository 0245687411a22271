// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include <sstream>
#include <string>

using namespace txml::parsers::xml;
using txml::test::decode;
using txml::test::onlyText;
using txml::test::scanAll;

TEST_CASE("XML Text - Entities", "[xml][text][entities]")
{
  SECTION("Named entities")
  {
    REQUIRE(onlyText("&lt;&gt;&amp;&apos;&quot;") == std::string("<>&'\""));
  }

  SECTION("Numeric entities")
  {
    auto scan = scanAll("&#60;&#x3E;");
    REQUIRE(scan.events.size() == 2);
    REQUIRE(scan.events[0].text.raw() == "&#60;");
    REQUIRE(scan.events[0].text == "<");
    REQUIRE(scan.events[1].text.raw() == "&#x3E;");
    REQUIRE(scan.events[1].text == ">");
  }

  SECTION("Upper-case hex marker and code point limits")
  {
    REQUIRE(decode(Text::escaped("&#X41;")).chars == U"A");
    REQUIRE(decode(Text::escaped("&#x10FFFF;")).chars == U"\U0010FFFF");
    REQUIRE(decode(Text::escaped("&#x1F600;")).chars == U"\U0001F600");

    auto nul = decode(Text::escaped("&#0;"));
    REQUIRE_FALSE(nul.error.has_value());
    REQUIRE(nul.chars.size() == 1);
    REQUIRE(nul.chars[0] == U'\0');
  }

  SECTION("Mixed text and references")
  {
    auto d = decode(Text::escaped("1 &lt; 2 &amp;&amp; 3 &gt; 2"));
    REQUIRE_FALSE(d.error.has_value());
    REQUIRE(d.chars == U"1 < 2 && 3 > 2");
  }
}

TEST_CASE("XML Text - Entity Errors", "[xml][text][errors]")
{
  auto errorOf = [](const char *slice) { return decode(Text::escaped(slice)).error; };

  SECTION("Unterminated named entity")
  {
    auto scan = scanAll("&lt");
    REQUIRE(scan.events.size() == 1);
    REQUIRE(scan.events[0].text.raw() == "&lt");
    REQUIRE(decode(scan.events[0].text).error == Error::UnterminatedEntity);
  }

  SECTION("Decimal value out of range")
  {
    auto scan = scanAll("&#1000000000;");
    REQUIRE(scan.events.size() == 1);
    REQUIRE(decode(scan.events[0].text).error == Error::InvalidNumericEntity);
  }

  SECTION("Hex value does not fit 32 bits")
  {
    REQUIRE(errorOf("&#x1000000000;") == Error::InvalidNumericEntity);
  }

  SECTION("Invalid hex digits")
  {
    REQUIRE(errorOf("&#xGHIJ;") == Error::InvalidNumericEntity);
  }

  SECTION("Malformed numerals")
  {
    REQUIRE(errorOf("&#;") == Error::InvalidNumericEntity);
    REQUIRE(errorOf("&#x;") == Error::InvalidNumericEntity);
    REQUIRE(errorOf("&#-1;") == Error::InvalidNumericEntity);
    REQUIRE(errorOf("&#12a;") == Error::InvalidNumericEntity);
  }

  SECTION("Surrogates and values past U+10FFFF")
  {
    REQUIRE(errorOf("&#xD800;") == Error::InvalidNumericEntity);
    REQUIRE(errorOf("&#xDFFF;") == Error::InvalidNumericEntity);
    REQUIRE(errorOf("&#x110000;") == Error::InvalidNumericEntity);
  }

  SECTION("Unknown names")
  {
    REQUIRE(errorOf("&foo;") == Error::InvalidNamedEntity);
    REQUIRE(errorOf("&;") == Error::InvalidNamedEntity);
    REQUIRE(errorOf("&LT;") == Error::InvalidNamedEntity);
  }

  SECTION("Error is reported once, then the text is exhausted")
  {
    Text text = Text::escaped("ok&bad;more");
    REQUIRE(text.next());
    REQUIRE(text.current() == U'o');
    REQUIRE(text.next());
    REQUIRE(text.current() == U'k');
    REQUIRE_FALSE(text.next());
    REQUIRE(text.error() == Error::InvalidNamedEntity);
    REQUIRE(text.raw().empty());
    REQUIRE(text.exhausted());
    REQUIRE_FALSE(text.next());
    REQUIRE_FALSE(text.error().has_value());
  }
}

TEST_CASE("XML Text - Verbatim and UTF-8", "[xml][text][utf8]")
{
  SECTION("Verbatim does not resolve references")
  {
    REQUIRE(Text::verbatim("&amp;") == "&amp;");
    REQUIRE_FALSE(decode(Text::verbatim("&bogus")).error.has_value());
  }

  SECTION("Multi-byte scalars")
  {
    // e-acute, euro sign, grinning face
    auto d = decode(Text::verbatim("h\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80"));
    REQUIRE_FALSE(d.error.has_value());
    REQUIRE(d.chars == U"h\u00E9\u20AC\U0001F600");
  }

  SECTION("Ill-formed bytes decode as the replacement character")
  {
    REQUIRE(decode(Text::verbatim("\xFF")).chars == U"\uFFFD");
    REQUIRE(decode(Text::verbatim("a\xC3")).chars == U"a\uFFFD");
    REQUIRE(decode(Text::verbatim("\xE2\x82")).chars == U"\uFFFD\uFFFD");
    // Overlong encoding of '/'
    REQUIRE(decode(Text::verbatim("\xC0\xAF")).chars == U"\uFFFD\uFFFD");
    // Encoded surrogate
    REQUIRE(decode(Text::verbatim("\xED\xA0\x80")).chars == U"\uFFFD\uFFFD\uFFFD");
  }

  SECTION("Plain text round-trips")
  {
    std::string plain = "plain words, digits 123 and punctuation!";
    Text text = Text::verbatim(plain);
    REQUIRE(text == plain);
    REQUIRE(Text::escaped(plain) == plain);

    std::string out;
    REQUIRE(text.appendUtf8(out));
    REQUIRE(out == plain);
  }
}

TEST_CASE("XML Text - Equality", "[xml][text][equality]")
{
  SECTION("Different modes with equal content")
  {
    REQUIRE(Text::escaped("a&lt;b") == Text::verbatim("a<b"));
    REQUIRE(Text::escaped("a&lt;b") == "a<b");
    REQUIRE("a<b" == Text::escaped("a&lt;b"));
  }

  SECTION("Different lengths are unequal")
  {
    REQUIRE(Text::verbatim("ab") != "abc");
    REQUIRE(Text::verbatim("abc") != "ab");
    REQUIRE(Text::verbatim("") == "");
  }

  SECTION("Decode errors are unequal")
  {
    REQUIRE(Text::escaped("&bad;") != "");
    REQUIRE(Text::escaped("&bad;") != Text::escaped("&bad;"));
    REQUIRE(Text::escaped("x&bad;") != "x");
  }

  SECTION("Comparison does not advance the operands")
  {
    Text text = Text::escaped("&amp;x");
    REQUIRE(text == "&x");
    REQUIRE(text.raw() == "&amp;x");
    REQUIRE(text.next());
    REQUIRE(text.current() == U'&');
  }

  SECTION("Copies are independent cursors")
  {
    Text original = Text::verbatim("xyz");
    Text copy = original;
    REQUIRE(copy.next());
    REQUIRE(copy.next());
    REQUIRE(copy.raw() == "z");
    REQUIRE(original.raw() == "xyz");
  }
}

TEST_CASE("XML Text - UTF-8 Output and Rendering", "[xml][text][display]")
{
  SECTION("appendUtf8 encodes decoded characters")
  {
    std::string out = "prefix:";
    Error err{};
    REQUIRE(Text::escaped("&#x20AC;&#233;").appendUtf8(out, &err));
    REQUIRE(out == "prefix:\xE2\x82\xAC\xC3\xA9");
  }

  SECTION("appendUtf8 keeps the decoded prefix on error")
  {
    std::string out;
    Error err{};
    REQUIRE_FALSE(Text::escaped("ab&x;cd").appendUtf8(out, &err));
    REQUIRE(out == "ab");
    REQUIRE(err == Error::InvalidNamedEntity);
  }

  SECTION("Debug rendering")
  {
    auto render = [](const Text &text)
    {
      std::ostringstream oss;
      oss << text;
      return oss.str();
    };
    REQUIRE(render(Text::escaped("a&quot;b")) == "\"a\\\"b\"");
    REQUIRE(render(Text::verbatim("l1\nl2\t")) == "\"l1\\nl2\\t\"");
    REQUIRE(render(Text::verbatim("\x01")) == "\"\\u{01}\"");
    REQUIRE(render(Text::escaped("x&bad;")) == "\"x\" <error: invalid named entity>");
  }
}
