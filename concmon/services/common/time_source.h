#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace concmon {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Wall clock plus the only suspension point the workers use.
class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual TimePoint now() const = 0;

  // Returns false when the sleep was cut short by a shutdown request.
  virtual bool sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemTimeSource : public TimeSource {
 public:
  TimePoint now() const override;
  bool sleepFor(std::chrono::milliseconds duration) override;

  // Wakes every sleeper and makes later sleeps return immediately.
  void interrupt();

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool interrupted_ = false;
};

// "HH:MM:SS" in local time
std::string formatClockTime(TimePoint time);

// Milliseconds since the Unix epoch
long long toEpochMillis(TimePoint time);

}  // namespace concmon
