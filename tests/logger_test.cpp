#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "services/log/file_sink.h"
#include "services/log/logger.h"

using namespace concmon;

namespace {

std::vector<std::string> readLines(const std::string& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  return lines;
}

}  // namespace

TEST(LoggerTest, ParsesLevelNames) {
  LogLevel level = LogLevel::INFO;
  EXPECT_TRUE(parseLogLevel("debug", level));
  EXPECT_EQ(level, LogLevel::DEBUG);
  EXPECT_TRUE(parseLogLevel("warning", level));
  EXPECT_EQ(level, LogLevel::WARN);
  EXPECT_TRUE(parseLogLevel("ERROR", level));
  EXPECT_EQ(level, LogLevel::ERROR);
  EXPECT_FALSE(parseLogLevel("verbose", level));
  EXPECT_EQ(level, LogLevel::ERROR);
}

TEST(LoggerTest, FormatsLevelTagAndMessage) {
  LogRecord record{std::chrono::system_clock::time_point(
                       std::chrono::milliseconds(1234567890125)),
                   LogLevel::WARN, "rs485", "Negative conductivity"};
  std::string line = formatLogRecord(record);

  EXPECT_NE(line.find(".125 WARN  [rs485] Negative conductivity"),
            std::string::npos)
      << line;

  record.tag.clear();
  line = formatLogRecord(record);
  EXPECT_EQ(line.find('['), std::string::npos) << line;
}

TEST(LoggerTest, RecordsBelowTheLevelAreDropped) {
  Logger logger(LogLevel::WARN, false);
  std::vector<LogRecord> seen;
  logger.addSink([&](const LogRecord& r) { seen.push_back(r); });

  logger.debug("t", "debug");
  logger.info("t", "info");
  logger.warn("t", "warn");
  logger.error("t", "error");
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0].message, "warn");
  EXPECT_EQ(seen[1].level, LogLevel::ERROR);

  logger.setLevel(LogLevel::DEBUG);
  logger.debug("t", "now visible");
  EXPECT_EQ(seen.size(), 3u);
}

TEST(LoggerTest, EverySinkReceivesEveryRecord) {
  Logger logger(LogLevel::DEBUG, false);
  int a = 0;
  int b = 0;
  logger.addSink([&](const LogRecord&) { ++a; });
  logger.addSink([&](const LogRecord&) { ++b; });

  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&logger] {
      for (int i = 0; i < 250; ++i) logger.info("worker", "line");
    });
  }
  for (auto& w : writers) w.join();

  EXPECT_EQ(a, 1000);
  EXPECT_EQ(b, 1000);
}

TEST(FileLogSinkTest, ForceFlushWritesPendingLines) {
  const std::string path = "concmon_logger_test.log";
  std::remove(path.c_str());
  {
    FileLogSink sink(path, 10);
    Logger logger(LogLevel::INFO, false);
    logger.addSink([&sink](const LogRecord& r) { sink.write(r); });

    logger.info("main", "first");
    logger.error("rs485", "Connection failed");
    sink.forceFlush();

    std::vector<std::string> lines = readLines(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("[main] first"), std::string::npos);
    EXPECT_NE(lines[1].find("ERROR [rs485] Connection failed"),
              std::string::npos);

    logger.info("main", "on shutdown");
  }
  // The destructor flushes what is still buffered
  EXPECT_EQ(readLines(path).size(), 3u);
  std::remove(path.c_str());
}

TEST(FileLogSinkTest, ConcurrentFlushesKeepLinesInOrder) {
  const std::string path = "concmon_logger_order_test.log";
  std::remove(path.c_str());
  const int total = 2000;
  {
    FileLogSink sink(path, 0);
    Logger logger(LogLevel::INFO, false);
    logger.addSink([&sink](const LogRecord& r) { sink.write(r); });

    std::atomic<bool> done{false};
    std::thread producer([&] {
      for (int i = 0; i < total; ++i) {
        logger.info("seq", "n=" + std::to_string(i));
      }
      done = true;
    });
    // Races the background writer, which flushes every 100 lines
    while (!done) sink.forceFlush();
    producer.join();
  }

  std::vector<std::string> lines = readLines(path);
  std::remove(path.c_str());
  ASSERT_EQ(lines.size(), static_cast<std::size_t>(total));
  for (int i = 0; i < total; ++i) {
    std::size_t pos = lines[i].find("n=");
    ASSERT_NE(pos, std::string::npos) << lines[i];
    ASSERT_EQ(std::stoi(lines[i].substr(pos + 2)), i) << "line " << i;
  }
}
