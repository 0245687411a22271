// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace
{
struct LogCapture
{
  txml::core::Logger::Level level;
  std::string formattedMessage;
  std::string rawMessage;
};

std::vector<LogCapture> capturedLogs;

void externalLogHandler(txml::core::Logger::Level level, const std::string &formattedMessage,
                        const std::string &rawMessage)
{
  capturedLogs.push_back({level, formattedMessage, rawMessage});
}

/// Restores the default logger state when a test case ends.
struct LoggerReset
{
  ~LoggerReset()
  {
    txml::core::Logger::clearExternalHandler();
    txml::core::Logger::setLogFormat("[%T] [%L] %m");
    txml::core::Logger::shutdown();
    txml::core::Logger::setLevel(txml::core::Logger::Level::Info);
  }
};
} // namespace

TEST_CASE("Logger file output", "[logger][file]")
{
  LoggerReset reset;
  txml::test::TempFile logFile("txml_testlog.log");

  txml::core::Logger::init(txml::core::Logger::Level::Trace, logFile.path());
  TXML_LOG_TRACE("Trace message");
  TXML_LOG_DEBUG("Debug message");
  TXML_LOG_INFO("Info message " << 42);
  TXML_LOG_WARN("Warn message");
  TXML_LOG_ERROR("Error message");
  TXML_LOG_FATAL("Fatal message");
  txml::core::Logger::shutdown();

  std::string content = logFile.read();
  REQUIRE(std::count(content.begin(), content.end(), '\n') == 6);
  REQUIRE(content.find("[INFO] Info message 42") != std::string::npos);
  REQUIRE(content.find("[WARN] Warn message") != std::string::npos);
}

TEST_CASE("Logger init fails for an unwritable path", "[logger][file]")
{
  LoggerReset reset;
  REQUIRE_THROWS_AS(
    txml::core::Logger::init(txml::core::Logger::Level::Info, "/nonexistent-dir/txml/log.txt"),
    std::runtime_error);
}

TEST_CASE("External log handler", "[logger][external]")
{
  LoggerReset reset;
  capturedLogs.clear();
  txml::core::Logger::setExternalHandler(externalLogHandler);

  SECTION("Level filtering")
  {
    txml::core::Logger::setLevel(txml::core::Logger::Level::Warning);
    txml::core::Logger::info("hidden");
    txml::core::Logger::warning("shown");
    txml::core::Logger::error("also shown");

    REQUIRE(capturedLogs.size() == 2);
    REQUIRE(capturedLogs[0].level == txml::core::Logger::Level::Warning);
    REQUIRE(capturedLogs[0].rawMessage == "shown");
    REQUIRE(capturedLogs[1].level == txml::core::Logger::Level::Error);
  }

  SECTION("Format placeholders")
  {
    txml::core::Logger::setLevel(txml::core::Logger::Level::Debug);
    txml::core::Logger::setLogFormat("%L|%m|%F|100%%");
    TXML_LOG_DEBUG("value=" << 7);

    REQUIRE(capturedLogs.size() == 1);
    REQUIRE(capturedLogs[0].rawMessage == "value=7");
    REQUIRE(capturedLogs[0].formattedMessage == "DEBUG|value=7|txml_test_logger.cpp|100%\n");
  }

  SECTION("Stream interface logs on destruction")
  {
    txml::core::Logger::setLevel(txml::core::Logger::Level::Info);
    txml::core::Logger::stream(txml::core::Logger::Level::Info) << "count: " << 3;

    REQUIRE(capturedLogs.size() == 1);
    REQUIRE(capturedLogs[0].rawMessage == "count: 3");
  }

  SECTION("Cleared handler stops capture")
  {
    txml::core::Logger::setLevel(txml::core::Logger::Level::Fatal);
    txml::core::Logger::clearExternalHandler();
    txml::core::Logger::fatal("to the console");
    REQUIRE(capturedLogs.empty());
  }
}

TEST_CASE("Logger level names", "[logger][levels]")
{
  using Level = txml::core::Logger::Level;
  REQUIRE(txml::core::Logger::levelFromString("TRACE") == Level::Trace);
  REQUIRE(txml::core::Logger::levelFromString("debug") == Level::Debug);
  REQUIRE(txml::core::Logger::levelFromString("warn") == Level::Warning);
  REQUIRE(txml::core::Logger::levelFromString("Warning") == Level::Warning);
  REQUIRE(txml::core::Logger::levelFromString("error") == Level::Error);
  REQUIRE(txml::core::Logger::levelFromString("fatal") == Level::Fatal);
  REQUIRE(txml::core::Logger::levelFromString("bogus") == Level::Info);
  REQUIRE(std::string(txml::core::Logger::levelToString(Level::Warning)) == "WARN");
}
