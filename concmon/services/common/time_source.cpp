#include "services/common/time_source.h"

#include <time.h>

namespace concmon {

TimePoint SystemTimeSource::now() const { return Clock::now(); }

bool SystemTimeSource::sleepFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, duration, [this] { return interrupted_; });
}

void SystemTimeSource::interrupt() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = true;
  }
  cv_.notify_all();
}

std::string formatClockTime(TimePoint time) {
  std::time_t t = Clock::to_time_t(time);
  struct tm local_tm;
  localtime_r(&t, &local_tm);
  char buf[16];
  strftime(buf, sizeof(buf), "%H:%M:%S", &local_tm);
  return std::string(buf);
}

long long toEpochMillis(TimePoint time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             time.time_since_epoch())
      .count();
}

}  // namespace concmon
