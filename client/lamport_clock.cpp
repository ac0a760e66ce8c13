#include "lamport_clock.hpp"

#include <algorithm>

namespace ramutex {

int64_t LogicalClock::tick() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (time_ < kMaxTime) ++time_;
  return time_;
}

int64_t LogicalClock::stamp() {
  return tick();
}

/*
 * observe
 * Merges a timestamp carried by an inbound message. The result is strictly
 * greater than both the remote value and the previous local value, up to
 * kMaxTime where it stops.
 */
int64_t LogicalClock::observe(int64_t remote) {
  std::lock_guard<std::mutex> lock(mutex_);
  time_ = std::max(time_, remote);
  if (time_ < kMaxTime) ++time_;
  return time_;
}

int64_t LogicalClock::now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return time_;
}

}  // namespace ramutex
