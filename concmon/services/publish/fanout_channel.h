#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "services/publish/bounded_queue.h"
#include "services/publish/fanout_message.h"

namespace concmon {

/**
 * @brief Distributes every published message to each subscriber's own
 * bounded queue.
 *
 * publish() never waits for a consumer: a slow subscriber only loses its own
 * oldest messages. Messages reach every subscriber in publish order.
 */
class FanoutChannel {
 public:
  using Queue = BoundedQueue<FanoutMessage>;
  using Subscription = std::shared_ptr<Queue>;

  Subscription subscribe(const std::string& name, std::size_t capacity);

  void publish(const FanoutMessage& message);

  std::size_t subscriberCount() const;

  // Total messages evicted across all subscribers.
  uint64_t droppedTotal() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, Subscription>> subscribers_;
};

}  // namespace concmon
