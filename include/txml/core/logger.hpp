// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of txml, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace txml
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

class LoggerStream;

/// \brief Thread-safe logger with levels, an optional log file, a configurable line format and
/// an optional external handler.
///
/// Writes to std::clog unless init() names a file. The tokenizer core never logs; the protocol
/// reader, the command line tool and the samples do.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External log handler: level, formatted line, message without prefix.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  static void init(Level level = Level::Info, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.timestampFormat = timeFormat;
    data.fileStream.reset();
    data.filePath = filePath;
    if (!filePath.empty())
    {
      auto stream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!stream->is_open())
      {
        throw std::runtime_error("Logger: cannot open log file: " + filePath);
      }
      data.fileStream = std::move(stream);
    }
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::clog.flush();
    }
  }

  /// \brief Flush and close the log file; later messages go to the console.
  static void shutdown()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
      data.fileStream.reset();
    }
    data.filePath.clear();
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level level()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Route every message to handler instead of the file or console.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  /// \brief Set the line format.
  ///
  /// Placeholders: %T timestamp, %t thread id, %L level, %m message, %F source file, %l source
  /// line, %f function, %% a literal percent sign. The default is "[%T] [%L] %m".
  static void setLogFormat(const std::string &format)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.format = format;
    compileFormat(format, data.segments);
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.format;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information.
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }

    std::string output = formatLine(data, level, message, file, line, function);
    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
    }
    else if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    else
    {
      std::clog << output;
    }
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    }
    return "UNKNOWN";
  }

  /// \brief Parse a level name (case-insensitive); unknown names map to Info.
  static Level levelFromString(const std::string &name)
  {
    std::string v;
    v.reserve(name.size());
    for (char c : name)
    {
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "trace")
    {
      return Level::Trace;
    }
    if (v == "debug")
    {
      return Level::Debug;
    }
    if (v == "warn" || v == "warning")
    {
      return Level::Warning;
    }
    if (v == "error")
    {
      return Level::Error;
    }
    if (v == "fatal")
    {
      return Level::Fatal;
    }
    return Level::Info;
  }

private:
  enum class FormatToken
  {
    Literal,
    Timestamp,
    ThreadId,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct FormatSegment
  {
    FormatToken token;
    std::string literal; ///< Only used when token == Literal
  };

  struct LoggerData
  {
    LoggerData() { compileFormat(format, segments); }

    std::mutex mutex;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string filePath;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    std::string format = "[%T] [%L] %m";
    std::vector<FormatSegment> segments;
    ExternalHandler externalHandler;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static std::string timestamp(const std::string &format)
  {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
  }

  static void compileFormat(const std::string &format, std::vector<FormatSegment> &segments)
  {
    segments.clear();
    std::string literal;
    auto flushLiteral = [&]()
    {
      if (!literal.empty())
      {
        segments.push_back({FormatToken::Literal, literal});
        literal.clear();
      }
    };

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        literal.push_back(format[i]);
        continue;
      }
      char code = format[++i];
      FormatToken token = FormatToken::Literal;
      switch (code)
      {
      case 'T':
        token = FormatToken::Timestamp;
        break;
      case 't':
        token = FormatToken::ThreadId;
        break;
      case 'L':
        token = FormatToken::Level;
        break;
      case 'm':
        token = FormatToken::Message;
        break;
      case 'F':
        token = FormatToken::File;
        break;
      case 'l':
        token = FormatToken::Line;
        break;
      case 'f':
        token = FormatToken::Function;
        break;
      case '%':
        literal.push_back('%');
        continue;
      default:
        literal.push_back('%');
        literal.push_back(code);
        continue;
      }
      flushLiteral();
      segments.push_back({token, std::string{}});
    }
    flushLiteral();
  }

  static std::string formatLine(const LoggerData &data, Level level, const std::string &message,
                                const char *file, int line, const char *function)
  {
    std::ostringstream oss;
    for (const auto &seg : data.segments)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
        oss << timestamp(data.timestampFormat);
        break;
      case FormatToken::ThreadId:
        oss << std::this_thread::get_id();
        break;
      case FormatToken::Level:
        oss << levelToString(level);
        break;
      case FormatToken::Message:
        oss << message;
        break;
      case FormatToken::File:
        oss << (file ? detail::basename(file) : "");
        break;
      case FormatToken::Line:
        if (file)
        {
          oss << line;
        }
        break;
      case FormatToken::Function:
        oss << (function ? function : "");
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }
};

/// \brief Stream interface for composing a message and emitting it on destruction.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level) {}

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _stream << value;
    return *this;
  }

  ~LoggerStream()
  {
    try
    {
      if (!_stream.str().empty())
      {
        Logger::log(_level, _stream.str());
      }
    }
    catch (const std::exception &e)
    {
      std::fprintf(stderr, "LoggerStream: %s\n", e.what());
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
};

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

/// \brief Stream-style logging macro with source location support
#define TXML_LOG_WITH_LEVEL(level, msg)                                                            \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    txml::core::Logger::log(txml::core::Logger::Level::level, _oss.str(), __FILE__, __LINE__,     \
                            __func__);                                                             \
  } while (0)

#define TXML_LOG_TRACE(msg) TXML_LOG_WITH_LEVEL(Trace, msg)
#define TXML_LOG_DEBUG(msg) TXML_LOG_WITH_LEVEL(Debug, msg)
#define TXML_LOG_INFO(msg) TXML_LOG_WITH_LEVEL(Info, msg)
#define TXML_LOG_WARN(msg) TXML_LOG_WITH_LEVEL(Warning, msg)
#define TXML_LOG_ERROR(msg) TXML_LOG_WITH_LEVEL(Error, msg)
#define TXML_LOG_FATAL(msg) TXML_LOG_WITH_LEVEL(Fatal, msg)

} // namespace core
} // namespace txml
