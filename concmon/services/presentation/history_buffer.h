#pragma once

#include <cstddef>
#include <deque>
#include <stdexcept>
#include <utility>

#include "services/common/time_source.h"

namespace concmon {

// Fixed-capacity chronological ring of (timestamp, value) points.
class HistoryBuffer {
 public:
  using Point = std::pair<TimePoint, double>;

  explicit HistoryBuffer(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("HistoryBuffer capacity must be positive");
    }
  }

  // Evicts the oldest point when full. Rejects a point older than the newest
  // one already stored.
  bool append(TimePoint time, double value) {
    if (!points_.empty() && time < points_.back().first) return false;
    if (points_.size() == capacity_) points_.pop_front();
    points_.emplace_back(time, value);
    return true;
  }

  const std::deque<Point>& points() const { return points_; }
  std::size_t size() const { return points_.size(); }
  std::size_t capacity() const { return capacity_; }
  bool empty() const { return points_.empty(); }

  double minValue() const;
  double maxValue() const;

 private:
  std::size_t capacity_;
  std::deque<Point> points_;
};

inline double HistoryBuffer::minValue() const {
  double m = points_.empty() ? 0.0 : points_.front().second;
  for (const auto& p : points_) m = p.second < m ? p.second : m;
  return m;
}

inline double HistoryBuffer::maxValue() const {
  double m = points_.empty() ? 0.0 : points_.front().second;
  for (const auto& p : points_) m = p.second > m ? p.second : m;
  return m;
}

}  // namespace concmon
