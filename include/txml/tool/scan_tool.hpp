// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <txml/core/config_loader.hpp>
#include <txml/core/logger.hpp>
#include <txml/parsers/xml.hpp>
#include <txml/protocol/protocol_reader.hpp>

#include <cstddef>
#include <fstream>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace txml
{
namespace tool
{
constexpr int kExitOk = 0;
constexpr int kExitInvalid = 1;
constexpr int kExitUsage = 2;

/// \brief Options gathered from the command line and the configuration file.
struct ToolConfig
{
  std::optional<std::string> configFile;
  std::optional<std::string> mode;
  std::optional<std::string> logLevel;
  std::optional<std::string> logFile;
  std::vector<std::string> files;
};

class UsageError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// \brief Print help message
inline void printHelp(std::ostream &out)
{
  out << "Usage: txml [options] <file>...\n"
      << "  -h, --help               Show this help message\n"
      << "  -c, --config <file>      TOML configuration file\n"
      << "  -m, --mode <mode>        events | check | protocol (default: events)\n"
      << "  -l, --log-level <level>  Log level (trace, debug, info, warning, error, fatal)\n"
      << "  -f, --log-file <file>    Log file path (default: console)\n";
}

/// \brief Parse command-line arguments. Returns false if help was requested.
/// \throws UsageError on an unknown option or a missing option value.
inline bool parseCliArgs(int argc, char **argv, ToolConfig &config, std::ostream &out)
{
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    auto needValue = [&]() -> std::string
    {
      if (i + 1 >= argc)
      {
        throw UsageError("Missing value for option: " + arg);
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help")
    {
      printHelp(out);
      return false;
    }
    else if (arg == "-c" || arg == "--config")
    {
      config.configFile = needValue();
    }
    else if (arg == "-m" || arg == "--mode")
    {
      config.mode = needValue();
    }
    else if (arg == "-l" || arg == "--log-level")
    {
      config.logLevel = needValue();
    }
    else if (arg == "-f" || arg == "--log-file")
    {
      config.logFile = needValue();
    }
    else if (arg.length() > 1 && arg[0] == '-')
    {
      throw UsageError("Unknown option: " + arg);
    }
    else
    {
      config.files.push_back(arg);
    }
  }
  return true;
}

/// \brief Fill options not given on the command line from the TOML configuration file.
inline void parseTomlConfig(ToolConfig &config)
{
  if (!config.configFile)
  {
    return;
  }
  core::ConfigLoader loader(*config.configFile);
  if (!config.logLevel)
  {
    config.logLevel = loader.getString("log.level");
  }
  if (!config.logFile)
  {
    config.logFile = loader.getString("log.file");
  }
  if (!config.mode)
  {
    config.mode = loader.getString("scan.mode");
  }
  if (config.files.empty())
  {
    if (auto files = loader.getStringArray("scan.files"))
    {
      config.files = *files;
    }
  }
}

/// \brief Effective scan mode.
/// \throws UsageError for an unknown mode or an empty file list.
inline std::string resolveMode(const ToolConfig &config)
{
  std::string mode = config.mode.value_or("events");
  if (mode != "events" && mode != "check" && mode != "protocol")
  {
    throw UsageError("Unknown mode: " + mode);
  }
  if (config.files.empty())
  {
    throw UsageError("No input files");
  }
  return mode;
}

inline std::size_t offsetOf(const std::string &doc, const parsers::xml::Scanner &scanner)
{
  return doc.size() - scanner.remaining().size();
}

inline int reportLexical(std::ostream &err, const std::string &path, std::size_t offset,
                         parsers::xml::Error error)
{
  err << path << ": byte " << offset << ": " << parsers::xml::describe(error) << '\n';
  TXML_LOG_DEBUG(path << ": lexical error at byte " << offset << ": " << error);
  return kExitInvalid;
}

/// Print every event. A scanner error is reported at the start of the construct that failed.
inline int runEvents(const std::string &path, const std::string &doc, std::ostream &out,
                     std::ostream &err)
{
  parsers::xml::Scanner scanner(doc);
  std::size_t count = 0;
  std::size_t offset = 0;
  while (true)
  {
    offset = offsetOf(doc, scanner);
    if (!scanner.next())
    {
      break;
    }
    out << scanner.current() << '\n';
    ++count;
  }
  TXML_LOG_DEBUG(path << ": " << count << " event(s)");
  if (scanner.error())
  {
    return reportLexical(err, path, offset, *scanner.error());
  }
  return kExitOk;
}

/// Drain every event, every attribute pair and every text value.
inline int runCheck(const std::string &path, const std::string &doc, std::ostream &out,
                    std::ostream &err)
{
  using namespace parsers::xml;
  Scanner scanner(doc);
  std::size_t events = 0;
  std::size_t offset = 0;
  while (true)
  {
    // Offset of the event about to be read; errors inside it point at its start.
    offset = offsetOf(doc, scanner);
    if (!scanner.next())
    {
      break;
    }
    ++events;
    const Event &ev = scanner.current();
    std::optional<Error> nested;
    if (ev.kind == EventKind::Open)
    {
      Attrs attrs = ev.attrs;
      while (!nested && attrs.next())
      {
        Text value = attrs.current().value;
        while (value.next())
        {
        }
        nested = value.error();
      }
      if (!nested)
      {
        nested = attrs.error();
      }
    }
    else if (ev.kind == EventKind::Text)
    {
      Text text = ev.text;
      while (text.next())
      {
      }
      nested = text.error();
    }
    if (nested)
    {
      return reportLexical(err, path, offset, *nested);
    }
  }
  if (scanner.error())
  {
    return reportLexical(err, path, offset, *scanner.error());
  }
  out << path << ": ok (" << events << " events)\n";
  return kExitOk;
}

inline int runProtocol(const std::string &path, const std::string &doc, std::ostream &out,
                       std::ostream &err)
{
  protocol::ReadResult result = protocol::ProtocolReader::read(doc);
  if (!result.ok)
  {
    err << path << ": byte " << result.offset << ": " << result.message << '\n';
    return kExitInvalid;
  }
  protocol::writeSummary(out, result.protocol);
  return kExitOk;
}

/// \throws std::runtime_error if the file cannot be opened.
inline std::string readFile(const std::string &path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
  {
    throw std::runtime_error("Cannot open file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

inline int processFile(const std::string &mode, const std::string &path, std::ostream &out,
                       std::ostream &err)
{
  std::string doc;
  try
  {
    doc = readFile(path);
  }
  catch (const std::runtime_error &e)
  {
    err << e.what() << '\n';
    return kExitUsage;
  }
  TXML_LOG_INFO("Processing " << path << " (" << doc.size() << " bytes, mode " << mode << ")");
  if (mode == "check")
  {
    return runCheck(path, doc, out, err);
  }
  if (mode == "protocol")
  {
    return runProtocol(path, doc, out, err);
  }
  return runEvents(path, doc, out, err);
}

/// \brief Process every file; the worst exit status wins.
inline int processFiles(const std::string &mode, const std::vector<std::string> &files,
                        std::ostream &out, std::ostream &err)
{
  int status = kExitOk;
  for (const auto &path : files)
  {
    int rc = processFile(mode, path, out, err);
    if (rc > status)
    {
      status = rc;
    }
  }
  return status;
}

} // namespace tool
} // namespace txml
