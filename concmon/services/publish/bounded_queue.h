#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace concmon {

/**
 * @brief Fixed-capacity FIFO that never makes the producer wait.
 *
 * When the queue is full, push() evicts the oldest element so the queue
 * always holds the most recent `capacity` items, still in push order.
 * Evictions are counted in dropped().
 */
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("BoundedQueue capacity must be positive");
    }
  }

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Returns false when an older element had to be dropped.
  bool push(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool kept_all = true;
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
      kept_all = false;
    }
    queue_.push_back(std::move(item));
    return kept_all;
  }

  bool tryPop(T& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return false;
    item = std::move(queue_.front());
    queue_.pop_front();
    return true;
  }

  // Moves everything queued into out, oldest first.
  std::size_t drain(std::vector<T>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = queue_.size();
    for (auto& item : queue_) out.push_back(std::move(item));
    queue_.clear();
    return n;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  bool empty() const { return size() == 0; }

  std::size_t capacity() const { return capacity_; }

  uint64_t dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

 private:
  mutable std::mutex mutex_;
  std::deque<T> queue_;
  const std::size_t capacity_;
  uint64_t dropped_ = 0;
};

}  // namespace concmon
