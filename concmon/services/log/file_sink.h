#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "services/log/logger.h"

namespace concmon {

/**
 * @brief Buffered log file writer.
 *
 * Lines are queued by write() and flushed by a background thread every
 * FLUSH_INTERVAL_SEC seconds or as soon as MAX_BUFFER_SIZE lines are pending.
 * The file is rotated to "<path>.old" once it reaches the configured size.
 */
class FileLogSink {
 public:
  FileLogSink(const std::string& path, std::size_t max_size_mb);
  ~FileLogSink();

  FileLogSink(const FileLogSink&) = delete;
  FileLogSink& operator=(const FileLogSink&) = delete;

  void write(const LogRecord& record);

  // Flush now, blocking until the pending lines are on disk.
  void forceFlush();

  const std::string& path() const { return path_; }

 private:
  static constexpr std::size_t MAX_BUFFER_SIZE = 100;
  static constexpr int FLUSH_INTERVAL_SEC = 5;
  static constexpr double MIN_FREE_SPACE_PERCENT = 5.0;

  void writerLoop();
  // Takes file_mutex_ before mutex_, so batches reach the file in the
  // order they left the buffer.
  void flushPending();
  void flushLines(std::queue<std::string>& lines);
  bool checkFreeSpace() const;
  void rotateLogIfNeeded();

  std::string path_;
  std::size_t max_size_mb_;

  std::mutex mutex_;       // buffer_, running_
  std::mutex file_mutex_;  // the file; always locked before mutex_
  std::condition_variable cv_;
  std::queue<std::string> buffer_;
  bool running_;
  std::thread writer_thread_;
};

}  // namespace concmon
