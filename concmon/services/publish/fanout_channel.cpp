#include "services/publish/fanout_channel.h"

#include <sstream>

namespace concmon {

std::string fanoutValueToString(const FanoutValue& value) {
  if (const double* d = std::get_if<double>(&value)) {
    std::ostringstream oss;
    oss << *d;
    return oss.str();
  }
  if (const bool* b = std::get_if<bool>(&value)) {
    return *b ? "ON" : "OFF";
  }
  return std::get<std::string>(value);
}

FanoutChannel::Subscription FanoutChannel::subscribe(const std::string& name,
                                                     std::size_t capacity) {
  auto queue = std::make_shared<Queue>(capacity);
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.emplace_back(name, queue);
  return queue;
}

void FanoutChannel::publish(const FanoutMessage& message) {
  // Held across all pushes so every subscriber sees the same order
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& subscriber : subscribers_) {
    subscriber.second->push(message);
  }
}

std::size_t FanoutChannel::subscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

uint64_t FanoutChannel::droppedTotal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t total = 0;
  for (const auto& subscriber : subscribers_) {
    total += subscriber.second->dropped();
  }
  return total;
}

}  // namespace concmon
