// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace lodns
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char* basename(const char* path)
  {
    const char* file = path;
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

/// \brief Thread-safe logger supporting log levels, async mode, daily file
/// rotation and retention.
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

  /// \brief External log handler: level, formatted line, raw message
  using ExternalHandler = std::function<void(Level level, const std::string& formattedMessage,
                                             const std::string& rawMessage)>;

  /// \brief Initialize the logger.
  /// \param level Minimum level emitted
  /// \param filePath Base path of the log file; empty logs to stdout
  /// \param async Emit from a background worker thread
  /// \param retentionDays Rotated files older than this are removed
  static void init(Level level = Level::Info, const std::string& filePath = "",
                   bool async = false, int retentionDays = 7,
                   const std::string& timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.asyncMode = async;
    data.exit = false;
    data.logBasePath = filePath;
    data.retentionDays = retentionDays;
    data.timestampFormat = timeFormat;
    data.currentLogDate.clear();
    data.fileStream.reset();
    rotateLogFileIfNeeded();

    if (data.asyncMode && !data.workerThread.joinable())
    {
      data.workerThread = std::thread(runWorker);
    }
  }

  static void flush()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    drainQueue();
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  static void shutdown()
  {
    flush();
    auto& data = getData();
    {
      std::lock_guard<std::mutex> lock(data.mutex);
      data.exit = true;
    }
    data.cv.notify_one();

    if (data.workerThread.joinable())
    {
      data.workerThread.join();
    }
  }

  static void setLevel(Level level)
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Register an external log handler. While registered, file and
  /// console output are disabled.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
    data.useExternalHandler = static_cast<bool>(data.externalHandler);
  }

  static void clearExternalHandler()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
    data.useExternalHandler = false;
  }

  /// \brief Set the log format string
  /// Supported placeholders:
  ///   %T - timestamp
  ///   %t - thread ID (hex hash)
  ///   %L - log level
  ///   %m - message
  ///   %F - source file name
  ///   %l - source line number
  ///   %f - function name
  ///   %% - literal percent sign
  /// \note Empty format strings are ignored.
  static void setLogFormat(const std::string& format)
  {
    if (format.empty())
    {
      return;
    }
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
    compileFormat(format, data.compiledFormat);
  }

  static std::string getLogFormat()
  {
    auto& data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  /// \brief Map a level name to a Level.
  /// \throws std::invalid_argument for unknown names
  static Level parseLevel(const std::string& name)
  {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
      return Level::Trace;
    if (lower == "debug")
      return Level::Debug;
    if (lower == "info")
      return Level::Info;
    if (lower == "warning" || lower == "warn")
      return Level::Warning;
    if (lower == "error")
      return Level::Error;
    if (lower == "fatal")
      return Level::Fatal;
    throw std::invalid_argument("Unknown log level: " + name);
  }

  static const char* levelToString(Level level)
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
    default:
      return "UNKNOWN";
    }
  }

  static void trace(const std::string& message) { log(Level::Trace, message); }
  static void debug(const std::string& message) { log(Level::Debug, message); }
  static void info(const std::string& message) { log(Level::Info, message); }
  static void warning(const std::string& message) { log(Level::Warning, message); }
  static void error(const std::string& message) { log(Level::Error, message); }
  static void fatal(const std::string& message) { log(Level::Fatal, message); }

  static void log(Level level, const std::string& message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information
  static void log(Level level, const std::string& message, const char* file, int line,
                  const char* function)
  {
    auto& data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }
    if (data.compiledFormat.empty())
    {
      compileFormat(data.logFormat, data.compiledFormat);
    }
    std::string output = formatLogMessage(level, message, file, line, function,
                                          data.compiledFormat, data.timestampFormat);

    if (data.useExternalHandler)
    {
      // Copy the handler so it runs without the logger lock held.
      auto handler = data.externalHandler;
      lock.unlock();
      handler(level, output, message);
      return;
    }

    if (data.asyncMode)
    {
      data.queue.push(std::move(output));
      lock.unlock();
      data.cv.notify_one();
      return;
    }

    write(output);
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
    std::string literal;
  };

  struct LoggerData
  {
    std::mutex mutex;
    std::condition_variable cv;
    std::queue<std::string> queue;
    std::thread workerThread;
    std::atomic<bool> exit{false};
    bool asyncMode = false;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string logBasePath;
    std::string currentLogDate;
    int retentionDays = 7;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    ExternalHandler externalHandler;
    bool useExternalHandler = false;
    std::string logFormat = "[%T] [%L] %m";
    std::vector<FormatSegment> compiledFormat;

    ~LoggerData()
    {
      exit = true;
      cv.notify_all();
      if (workerThread.joinable())
      {
        workerThread.join();
      }
    }
  };

  static LoggerData& getData()
  {
    static LoggerData data;
    return data;
  }

  static void runWorker()
  {
    auto& data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    while (true)
    {
      data.cv.wait(lock, [&data] { return !data.queue.empty() || data.exit; });
      drainQueue();
      if (data.exit)
      {
        break;
      }
    }
  }

  /// \note Caller holds the logger mutex.
  static void drainQueue()
  {
    auto& data = getData();
    while (!data.queue.empty())
    {
      write(data.queue.front());
      data.queue.pop();
    }
  }

  /// \note Caller holds the logger mutex.
  static void write(const std::string& entry)
  {
    auto& data = getData();
    rotateLogFileIfNeeded();
    if (data.fileStream)
    {
      (*data.fileStream) << entry;
      data.fileStream->flush();
    }
    else
    {
      std::cout << entry;
    }
  }

  static std::string currentDate()
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
  }

  static void rotateLogFileIfNeeded()
  {
    auto& data = getData();
    if (data.logBasePath.empty())
    {
      return;
    }

    namespace fs = std::filesystem;
    auto logPath = fs::path(data.logBasePath);
    auto logDir = logPath.parent_path();
    if (logDir.empty())
    {
      logDir = fs::current_path();
    }
    std::error_code ec;
    if (!fs::exists(logDir, ec))
    {
      fs::create_directories(logDir, ec);
      if (ec)
      {
        std::cerr << "[Logger] Failed to create log directory: " << logDir << " - "
                  << ec.message() << std::endl;
        return;
      }
    }

    std::string today = currentDate();
    if (today == data.currentLogDate && data.fileStream)
    {
      return;
    }

    data.currentLogDate = today;
    std::string rotatedPath =
      (logDir / (logPath.filename().string() + "." + today + ".log")).string();
    data.fileStream = std::make_unique<std::ofstream>(rotatedPath, std::ios::app);
    if (!data.fileStream->is_open())
    {
      std::cerr << "[Logger] Failed to open rotated log file: " << rotatedPath << std::endl;
      data.fileStream.reset();
      return;
    }
    deleteOldLogFiles(logDir, logPath.filename().string() + ".");
  }

  static void deleteOldLogFiles(const std::filesystem::path& logDir, const std::string& prefix)
  {
    auto& data = getData();
    if (data.retentionDays <= 0)
    {
      return;
    }

    namespace fs = std::filesystem;
    auto now = std::chrono::system_clock::now();
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(logDir, ec))
    {
      std::string fname = entry.path().filename().string();
      if (fname.rfind(prefix, 0) != 0 || fname.size() < prefix.size() + 10)
      {
        continue;
      }

      // baseName.YYYY-MM-DD.log
      std::tm tm{};
      std::istringstream ss(fname.substr(prefix.size(), 10));
      ss >> std::get_time(&tm, "%Y-%m-%d");
      if (ss.fail())
      {
        continue;
      }
      auto fileTime = std::chrono::system_clock::from_time_t(std::mktime(&tm));
      auto fileDays = std::chrono::duration_cast<std::chrono::hours>(now - fileTime).count() / 24;
      if (fileDays >= data.retentionDays)
      {
        std::error_code rmEc;
        fs::remove(entry.path(), rmEc);
        if (rmEc)
        {
          std::cerr << "[Logger] Failed to delete old log file: " << entry.path() << " - "
                    << rmEc.message() << std::endl;
        }
      }
    }
  }

  static void compileFormat(const std::string& format, std::vector<FormatSegment>& segments)
  {
    segments.clear();
    std::string literal;

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        literal += format[i];
        continue;
      }

      FormatToken token;
      switch (format[i + 1])
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
        literal += '%';
        ++i;
        continue;
      default:
        // Unknown placeholder, keep the percent sign
        literal += format[i];
        continue;
      }

      if (!literal.empty())
      {
        segments.push_back({FormatToken::Literal, std::move(literal)});
        literal.clear();
      }
      segments.push_back({token, ""});
      ++i;
    }

    if (!literal.empty())
    {
      segments.push_back({FormatToken::Literal, std::move(literal)});
    }
  }

  static std::string formatLogMessage(Level level, const std::string& message, const char* file,
                                      int line, const char* function,
                                      const std::vector<FormatSegment>& segments,
                                      const std::string& timestampFmt)
  {
    std::ostringstream oss;
    for (const auto& seg : segments)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
      {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms =
          std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        oss << std::put_time(&tm, timestampFmt.c_str());
        if (timestampFmt.find("%S") != std::string::npos)
        {
          oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        }
        break;
      }
      case FormatToken::ThreadId:
      {
        std::size_t threadHash = std::hash<std::thread::id>{}(std::this_thread::get_id());
        oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2) << threadHash
            << std::dec;
        break;
      }
      case FormatToken::Level:
        oss << levelToString(level);
        break;
      case FormatToken::Message:
        oss << message;
        break;
      case FormatToken::File:
        if (file)
          oss << detail::basename(file);
        break;
      case FormatToken::Line:
        if (file)
          oss << line;
        break;
      case FormatToken::Function:
        if (function)
          oss << function;
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }
};

/// \brief Stream-style logging macro with source location support
#define LODNS_LOG_WITH_LEVEL(level, msg)                                                           \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    lodns::core::Logger::log(lodns::core::Logger::Level::level, _oss.str(), __FILE__, __LINE__,    \
                             __func__);                                                            \
  } while (0)

#define LODNS_LOG_TRACE(msg) LODNS_LOG_WITH_LEVEL(Trace, msg)
#define LODNS_LOG_DEBUG(msg) LODNS_LOG_WITH_LEVEL(Debug, msg)
#define LODNS_LOG_INFO(msg) LODNS_LOG_WITH_LEVEL(Info, msg)
#define LODNS_LOG_WARN(msg) LODNS_LOG_WITH_LEVEL(Warning, msg)
#define LODNS_LOG_ERROR(msg) LODNS_LOG_WITH_LEVEL(Error, msg)
#define LODNS_LOG_FATAL(msg) LODNS_LOG_WITH_LEVEL(Fatal, msg)

} // namespace core
} // namespace lodns
