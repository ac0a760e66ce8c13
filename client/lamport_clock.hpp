#pragma once
#include <cstdint>
#include <limits>
#include <mutex>

namespace ramutex {

// LogicalClock is a Lamport clock owned by one peer. The initiator, the
// inbound request handler and the reply collector all advance it
// concurrently, so every operation is a single locked read-modify-write.
class LogicalClock {
public:
  // The clock saturates at kMaxTime instead of wrapping.
  static constexpr int64_t kMaxTime = std::numeric_limits<int64_t>::max();

  explicit LogicalClock(int64_t initial = 0) : time_(initial) {}

  // Whether a timestamp carried by a message is one a peer could have
  // produced. Anything else is a protocol violation and must not be
  // observed.
  static bool valid_remote(int64_t ts) { return ts >= 0 && ts < kMaxTime; }

  // Local event. Returns the new value.
  int64_t tick();

  // Originating an outbound message; same rule as tick().
  int64_t stamp();

  // Receipt of any message: local = max(local, remote) + 1.
  int64_t observe(int64_t remote);

  int64_t now() const;

private:
  mutable std::mutex mutex_;
  int64_t time_;
};

}  // namespace ramutex
