#include "services/log/logger.h"

#include <time.h>

#include <cstdio>
#include <iostream>

namespace concmon {

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
  }
  return "?";
}

bool parseLogLevel(const std::string& text, LogLevel& level) {
  if (text == "debug" || text == "DEBUG") {
    level = LogLevel::DEBUG;
  } else if (text == "info" || text == "INFO") {
    level = LogLevel::INFO;
  } else if (text == "warn" || text == "WARN" || text == "warning") {
    level = LogLevel::WARN;
  } else if (text == "error" || text == "ERROR") {
    level = LogLevel::ERROR;
  } else {
    return false;
  }
  return true;
}

std::string formatLogRecord(const LogRecord& record) {
  std::time_t t = std::chrono::system_clock::to_time_t(record.time);
  struct tm local_tm;
  localtime_r(&t, &local_tm);
  char date[24];
  strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local_tm);

  long long millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                         record.time.time_since_epoch())
                         .count() %
                     1000;

  char prefix[64];
  std::snprintf(prefix, sizeof(prefix), "%s.%03lld %-5s ", date, millis,
                logLevelName(record.level));

  std::string line(prefix);
  if (!record.tag.empty()) line += "[" + record.tag + "] ";
  line += record.message;
  return line;
}

Logger::Logger(LogLevel level, bool console)
    : level_(level), console_(console) {}

void Logger::addSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_.push_back(std::move(sink));
}

void Logger::log(LogLevel level, const std::string& tag,
                 const std::string& message) {
  if (level < level_.load()) return;

  LogRecord record{std::chrono::system_clock::now(), level, tag, message};

  std::lock_guard<std::mutex> lock(mutex_);
  if (console_) {
    std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    out << formatLogRecord(record) << std::endl;
  }
  for (const auto& sink : sinks_) {
    sink(record);
  }
}

}  // namespace concmon
