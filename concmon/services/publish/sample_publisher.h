#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

#include "services/common/time_source.h"
#include "services/log/logger.h"
#include "services/publish/fanout_channel.h"
#include "services/transport/transport.h"

namespace concmon {

// {"timestamp": <ms>, "device_id": <source>, "status": "OK",
//  "data": {<key>: <value>}}
nlohmann::json createEnvelopeJson(const FanoutMessage& message);

// "<source>/<key>"
std::string envelopeTopic(const FanoutMessage& message);

/**
 * @brief Forwards every fan-out message to out-of-process subscribers.
 *
 * Runs on its own thread and drains its subscription on a short timer; a
 * failed send is logged once per outage and the message is dropped.
 */
class SamplePublisher {
 public:
  static constexpr std::chrono::milliseconds FLUSH_INTERVAL{100};

  SamplePublisher(transport::Transport& transport,
                  FanoutChannel::Subscription subscription, TimeSource& time,
                  Logger& logger);

  void run(const std::atomic<bool>& running);

  // Sends everything queued; returns the number of messages sent.
  std::size_t flush();

  uint64_t sent() const { return sent_; }
  uint64_t failed() const { return failed_; }

 private:
  transport::Transport& transport_;
  FanoutChannel::Subscription subscription_;
  TimeSource& time_;
  Logger& log_;

  bool failing_ = false;
  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> failed_{0};
};

}  // namespace concmon
