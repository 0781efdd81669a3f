#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace concmon {

enum class LogLevel { DEBUG = 0, INFO, WARN, ERROR };

const char* logLevelName(LogLevel level);
bool parseLogLevel(const std::string& text, LogLevel& level);

struct LogRecord {
  std::chrono::system_clock::time_point time;
  LogLevel level;
  std::string tag;
  std::string message;
};

// "2026-01-01 08:00:00.125 INFO  [rs485-1] message"
std::string formatLogRecord(const LogRecord& record);

using LogSink = std::function<void(const LogRecord&)>;

/**
 * @brief Thread-safe line logger.
 *
 * One instance is built in main() and handed to every worker by reference.
 * Lines go to stdout (stderr for WARN / ERROR) and to each extra sink, all
 * under one mutex so lines from different threads never interleave.
 */
class Logger {
 public:
  explicit Logger(LogLevel level = LogLevel::INFO, bool console = true);

  void setLevel(LogLevel level) { level_ = level; }
  LogLevel level() const { return level_; }

  void addSink(LogSink sink);

  void log(LogLevel level, const std::string& tag, const std::string& message);

  void debug(const std::string& tag, const std::string& message) {
    log(LogLevel::DEBUG, tag, message);
  }
  void info(const std::string& tag, const std::string& message) {
    log(LogLevel::INFO, tag, message);
  }
  void warn(const std::string& tag, const std::string& message) {
    log(LogLevel::WARN, tag, message);
  }
  void error(const std::string& tag, const std::string& message) {
    log(LogLevel::ERROR, tag, message);
  }

 private:
  std::atomic<LogLevel> level_;
  const bool console_;
  std::mutex mutex_;
  std::vector<LogSink> sinks_;
};

}  // namespace concmon
