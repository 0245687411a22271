// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include <txml/tool/scan_tool.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

using namespace txml::tool;
using txml::parsers::xml::describe;
using txml::parsers::xml::Error;
using txml::test::TempFile;

namespace
{
/// Argument vector for parseCliArgs; argv[0] is the program name.
struct Args
{
  explicit Args(std::vector<std::string> list) : strings(std::move(list))
  {
    strings.insert(strings.begin(), "txml");
    for (auto &s : strings)
    {
      pointers.push_back(&s[0]);
    }
  }
  int argc() const { return static_cast<int>(pointers.size()); }
  char **argv() { return pointers.data(); }

  std::vector<std::string> strings;
  std::vector<char *> pointers;
};

std::string lexicalLine(const std::string &path, std::size_t offset, Error error)
{
  return path + ": byte " + std::to_string(offset) + ": " + describe(error) + "\n";
}
} // namespace

TEST_CASE("Scan tool - check mode", "[tool][check]")
{
  txml::test::initializeTestLogging();
  std::ostringstream out;
  std::ostringstream err;

  SECTION("Valid document")
  {
    REQUIRE(runCheck("doc", "<a k=\"1 &amp; 2\">t&lt;</a>", out, err) == kExitOk);
    REQUIRE(out.str() == "doc: ok (4 events)\n");
    REQUIRE(err.str().empty());
  }

  SECTION("Scanner error is reported at the start of the failing construct")
  {
    REQUIRE(runCheck("doc", "<a><!-- x", out, err) == kExitInvalid);
    REQUIRE(err.str() == lexicalLine("doc", 3, Error::UnterminatedComment));
    REQUIRE(out.str().empty());
  }

  SECTION("Attribute values are decoded")
  {
    REQUIRE(runCheck("doc", "<r><a v='&bad;'/></r>", out, err) == kExitInvalid);
    REQUIRE(err.str() == lexicalLine("doc", 3, Error::InvalidNamedEntity));
  }

  SECTION("Attribute syntax is checked")
  {
    REQUIRE(runCheck("doc", "<r a='1' b=2>", out, err) == kExitInvalid);
    REQUIRE(err.str() == lexicalLine("doc", 0, Error::AttrInvalidQuote));
  }

  SECTION("Text is decoded")
  {
    REQUIRE(runCheck("doc", "<a>x&#xZZ;</a>", out, err) == kExitInvalid);
    REQUIRE(err.str() == lexicalLine("doc", 4, Error::InvalidNumericEntity));
  }
}

TEST_CASE("Scan tool - events mode", "[tool][events]")
{
  std::ostringstream out;
  std::ostringstream err;

  SECTION("One line per event")
  {
    REQUIRE(runEvents("doc", "<a/>", out, err) == kExitOk);
    std::string printed = out.str();
    REQUIRE(std::count(printed.begin(), printed.end(), '\n') == 2);
    REQUIRE(err.str().empty());
  }

  SECTION("Events before the error are printed, the error points at its construct")
  {
    REQUIRE(runEvents("doc", "<a><!-- x", out, err) == kExitInvalid);
    std::string printed = out.str();
    REQUIRE(std::count(printed.begin(), printed.end(), '\n') == 1);
    REQUIRE(err.str() == lexicalLine("doc", 3, Error::UnterminatedComment));
  }
}

TEST_CASE("Scan tool - protocol mode", "[tool][protocol]")
{
  std::ostringstream out;
  std::ostringstream err;

  SECTION("Summary")
  {
    REQUIRE(runProtocol("doc", "<protocol name=\"p\"/>", out, err) == kExitOk);
    REQUIRE(out.str() == "protocol p\n");
  }

  SECTION("Failure with offset")
  {
    REQUIRE(runProtocol("doc", "<protocol name=\"p\"><!-- x", out, err) == kExitInvalid);
    REQUIRE(err.str().rfind("doc: byte 19: ", 0) == 0);
  }
}

TEST_CASE("Scan tool - exit status over several files", "[tool][status]")
{
  TempFile good("txml_test_tool_good.xml", "<a>ok</a>");
  TempFile bad("txml_test_tool_bad.xml", "<a><!-- x");
  TempFile missing("txml_test_tool_missing.xml");
  std::ostringstream out;
  std::ostringstream err;

  SECTION("All files succeed")
  {
    REQUIRE(processFiles("check", {good.path(), good.path()}, out, err) == kExitOk);
  }

  SECTION("Lexical failure wins over success")
  {
    REQUIRE(processFiles("check", {bad.path(), good.path()}, out, err) == kExitInvalid);
    REQUIRE(out.str() == good.path() + ": ok (3 events)\n");
    REQUIRE(err.str() == lexicalLine(bad.path(), 3, Error::UnterminatedComment));
  }

  SECTION("I/O failure wins over lexical failure")
  {
    REQUIRE(processFiles("events", {missing.path(), bad.path(), good.path()}, out, err) ==
            kExitUsage);
    REQUIRE(err.str().find("Cannot open file: " + missing.path()) != std::string::npos);
  }
}

TEST_CASE("Scan tool - command line", "[tool][cli]")
{
  ToolConfig config;
  std::ostringstream out;

  SECTION("Options and files")
  {
    Args args({"-m", "check", "--log-level", "debug", "a.xml", "-f", "t.log", "b.xml"});
    REQUIRE(parseCliArgs(args.argc(), args.argv(), config, out));
    REQUIRE(config.mode == std::string("check"));
    REQUIRE(config.logLevel == std::string("debug"));
    REQUIRE(config.logFile == std::string("t.log"));
    REQUIRE(config.files == std::vector<std::string>{"a.xml", "b.xml"});
    REQUIRE_FALSE(config.configFile.has_value());
  }

  SECTION("Help")
  {
    Args args({"a.xml", "--help"});
    REQUIRE_FALSE(parseCliArgs(args.argc(), args.argv(), config, out));
    REQUIRE(out.str().find("Usage: txml") != std::string::npos);
  }

  SECTION("Unknown option")
  {
    Args args({"--bogus"});
    REQUIRE_THROWS_AS(parseCliArgs(args.argc(), args.argv(), config, out), UsageError);
  }

  SECTION("Missing option value")
  {
    Args args({"a.xml", "-m"});
    REQUIRE_THROWS_AS(parseCliArgs(args.argc(), args.argv(), config, out), UsageError);
  }
}

TEST_CASE("Scan tool - configuration file", "[tool][config]")
{
  TempFile cfg("txml_test_tool.toml", "[log]\n"
                                      "level = \"error\"\n"
                                      "file = \"scan.log\"\n"
                                      "[scan]\n"
                                      "mode = \"protocol\"\n"
                                      "files = [\"x.xml\", \"y.xml\"]\n");

  SECTION("Values fill unset options")
  {
    ToolConfig config;
    config.configFile = cfg.path();
    parseTomlConfig(config);
    REQUIRE(config.logLevel == std::string("error"));
    REQUIRE(config.logFile == std::string("scan.log"));
    REQUIRE(resolveMode(config) == "protocol");
    REQUIRE(config.files == std::vector<std::string>{"x.xml", "y.xml"});
  }

  SECTION("Command line overrides configuration")
  {
    ToolConfig config;
    std::ostringstream out;
    Args args({"-c", cfg.path(), "-m", "check", "-l", "info", "z.xml"});
    REQUIRE(parseCliArgs(args.argc(), args.argv(), config, out));
    parseTomlConfig(config);
    REQUIRE(resolveMode(config) == "check");
    REQUIRE(config.logLevel == std::string("info"));
    REQUIRE(config.logFile == std::string("scan.log"));
    REQUIRE(config.files == std::vector<std::string>{"z.xml"});
  }

  SECTION("Unreadable configuration throws")
  {
    ToolConfig config;
    config.configFile = "txml_test_tool_no_such.toml";
    REQUIRE_THROWS_AS(parseTomlConfig(config), std::runtime_error);
  }
}

TEST_CASE("Scan tool - mode resolution", "[tool][mode]")
{
  ToolConfig config;
  config.files.push_back("a.xml");

  SECTION("Default mode")
  {
    REQUIRE(resolveMode(config) == "events");
  }

  SECTION("Unknown mode")
  {
    config.mode = "validate";
    REQUIRE_THROWS_AS(resolveMode(config), UsageError);
  }

  SECTION("No input files")
  {
    config.files.clear();
    REQUIRE_THROWS_AS(resolveMode(config), UsageError);
  }
}
