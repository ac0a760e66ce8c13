#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace ramutex {

enum class MutexState {
  kReleased,  // not in the critical section and not asking for it
  kWanted,    // request broadcast, waiting for every other peer to reply
  kHeld,      // inside the critical section
};

inline const char* to_string(MutexState s) {
  switch (s) {
    case MutexState::kReleased: return "RELEASED";
    case MutexState::kWanted: return "WANTED";
    case MutexState::kHeld: return "HELD";
  }
  return "UNKNOWN";
}

// One entry of the static peer set. Fixed for the process lifetime.
struct PeerRecord {
  int id = 0;
  std::string addr;
};

struct AccessRequest {
  int requester_id = 0;
  int64_t timestamp = 0;
  int64_t request_number = 0;
};

// granted=false is only an acknowledgement of a deferred request; the
// actual grant for that request arrives later as a ReleaseNotice.
struct AccessReply {
  int granter_id = 0;
  bool granted = false;
  int64_t request_timestamp = 0;  // timestamp of the request being answered
  int64_t timestamp = 0;          // granter's clock when replying
};

struct ReleaseNotice {
  int releaser_id = 0;
  int64_t request_timestamp = 0;  // deferred request this notice grants
  int64_t timestamp = 0;
  int64_t request_number = 0;
};

// has_priority reports whether request (ts_a, id_a) goes before
// (ts_b, id_b): lower timestamp first, ties broken by lower id.
inline bool has_priority(int64_t ts_a, int id_a, int64_t ts_b, int id_b) {
  return ts_a < ts_b || (ts_a == ts_b && id_a < id_b);
}

// PeerState is the per-engine protocol bookkeeping. It is only ever touched
// while MutexEngine holds its state mutex; a copy is handed out for status
// display.
struct PeerState {
  MutexState state = MutexState::kReleased;
  int64_t request_timestamp = 0;
  int64_t request_number = 0;

  // Peers whose reply to the outstanding request has not arrived yet.
  std::set<int> awaiting;

  // Requesters answered only at release, keyed by id, with the timestamp
  // of the request they are waiting on.
  std::map<int, int64_t> deferred;

  int64_t completed_rounds = 0;

  int pending_reply_count() const { return static_cast<int>(awaiting.size()); }
};

}  // namespace ramutex
