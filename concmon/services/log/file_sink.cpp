#include "services/log/file_sink.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <iostream>

namespace concmon {

FileLogSink::FileLogSink(const std::string& path, std::size_t max_size_mb)
    : path_(path), max_size_mb_(max_size_mb), running_(true) {
  writer_thread_ = std::thread(&FileLogSink::writerLoop, this);
}

FileLogSink::~FileLogSink() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (writer_thread_.joinable()) {
    writer_thread_.join();
  }
  forceFlush();
}

void FileLogSink::write(const LogRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  buffer_.push(formatLogRecord(record));

  if (buffer_.size() >= MAX_BUFFER_SIZE) {
    cv_.notify_one();
  }
}

void FileLogSink::forceFlush() { flushPending(); }

void FileLogSink::flushPending() {
  std::lock_guard<std::mutex> file_lock(file_mutex_);
  std::queue<std::string> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending.swap(buffer_);
  }
  flushLines(pending);
}

void FileLogSink::writerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    // Wake when the buffer is full or after FLUSH_INTERVAL_SEC
    cv_.wait_for(lock, std::chrono::seconds(FLUSH_INTERVAL_SEC), [this] {
      return buffer_.size() >= MAX_BUFFER_SIZE || !running_;
    });

    if (buffer_.empty()) continue;

    lock.unlock();
    flushPending();
    lock.lock();
  }
}

bool FileLogSink::checkFreeSpace() const {
  std::string dir = ".";
  std::size_t slash = path_.find_last_of('/');
  if (slash != std::string::npos) dir = slash == 0 ? "/" : path_.substr(0, slash);

  struct statvfs stat;
  if (statvfs(dir.c_str(), &stat) != 0 || stat.f_blocks == 0) {
    return true;
  }

  double free_percent = static_cast<double>(stat.f_bavail) /
                        static_cast<double>(stat.f_blocks) * 100.0;
  if (free_percent < MIN_FREE_SPACE_PERCENT) {
    std::cerr << "[LOG] Disk almost full (" << free_percent
              << "% free), dropping log lines" << std::endl;
    return false;
  }
  return true;
}

void FileLogSink::rotateLogIfNeeded() {
  if (max_size_mb_ == 0) return;

  struct stat st;
  if (stat(path_.c_str(), &st) != 0) return;

  std::size_t size_mb = static_cast<std::size_t>(st.st_size) / (1024 * 1024);
  if (size_mb >= max_size_mb_) {
    std::string backup = path_ + ".old";
    if (std::rename(path_.c_str(), backup.c_str()) != 0) {
      std::cerr << "[LOG] Cannot rotate " << path_ << std::endl;
    }
  }
}

void FileLogSink::flushLines(std::queue<std::string>& lines) {
  if (lines.empty()) return;
  if (!checkFreeSpace()) return;

  rotateLogIfNeeded();

  int fd = open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd == -1) {
    std::cerr << "[LOG] Cannot open log file: " << path_ << std::endl;
    return;
  }

  while (!lines.empty()) {
    std::string line = lines.front() + "\n";
    lines.pop();

    ssize_t written = ::write(fd, line.c_str(), line.size());
    if (written == -1) {
      std::cerr << "[LOG] Write failed: " << path_ << std::endl;
      break;
    }
  }

  fsync(fd);
  close(fd);
}

}  // namespace concmon
