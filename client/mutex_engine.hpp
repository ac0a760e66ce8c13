#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "lamport_clock.hpp"
#include "peer_state.hpp"
#include "peer_transport.hpp"
#include "resource_client.hpp"

namespace ramutex {

// What to do with a peer that cannot be reached while we are WANTED.
// Under kStall the initiator stays blocked in wait_until_held() and nothing
// but the missing reply wakes it, so a client stalled this way does not
// react to SIGINT; it has to be killed.
enum class FailurePolicy {
  kStall,    // keep waiting for its reply; the round never completes
  kExclude,  // count it as replied for the current round only
};

struct PeerSnapshot {
  PeerState state;
  int64_t clock = 0;
  int64_t failed_rounds = 0;
  int64_t protocol_violations = 0;
};

// MutexEngine runs the Ricart-Agrawala protocol for one peer. It is the
// initiator of the peer's own requests and the responder to every other
// peer; inbound calls arrive on transport threads while the initiator
// blocks in wait_until_held(). All protocol state lives in one PeerState
// guarded by a single mutex held for each whole transition.
class MutexEngine {
public:
  MutexEngine(int self_id, const std::vector<PeerRecord>& peers, PeerTransport* transport,
              ResourceClient* resource, FailurePolicy policy = FailurePolicy::kStall);

  MutexEngine(const MutexEngine&) = delete;
  MutexEngine& operator=(const MutexEngine&) = delete;

  // Full cycle: request, wait for every reply, submit payload to the
  // resource, release. The resource outcome is returned; release happens
  // whether or not the work succeeded. Local callers are serialized.
  WorkResult run_exclusive(const std::string& payload);

  // RELEASED -> WANTED and broadcast. Returns false if a round is already
  // in progress. Blocks only for the duration of the N-1 calls themselves.
  bool request_access(int64_t* timestamp = nullptr);

  // Blocks until the outstanding request is granted by every peer. Returns
  // true when HELD.
  bool wait_until_held();
  bool wait_until_held(std::chrono::milliseconds timeout);

  // HELD -> RELEASED, then grants every deferred requester. Returns false
  // if not HELD.
  bool release();

  // Inbound AccessRequest. Fills reply with a grant or a deferral
  // acknowledgement. Returns false (state untouched) for an unknown
  // requester.
  bool receive_request(const AccessRequest& req, AccessReply* reply);

  // Inbound reply to our outstanding request. Returns false for a
  // duplicate, stale or unknown reply, which is otherwise ignored.
  bool receive_reply(const AccessReply& reply);

  // Inbound deferred grant. Same acceptance rules as a granted reply.
  bool receive_release(const ReleaseNotice& notice);

  PeerSnapshot snapshot() const;
  MutexState state() const;

  int self_id() const { return self_id_; }
  int peer_count() const { return static_cast<int>(peers_.size()); }
  LogicalClock& clock() { return clock_; }

private:
  void broadcast_request(const AccessRequest& req, const std::vector<int>& targets);
  void on_request_failure(int peer_id, int64_t request_timestamp);
  bool accept_grant_locked(int granter_id, int64_t request_timestamp, int64_t sender_ts,
                           const char* kind);
  void reject(const char* what, int peer_id, int64_t request_timestamp);
  bool is_known_peer(int peer_id) const;

  const int self_id_;
  const std::vector<PeerRecord> peers_;
  PeerTransport* transport_;
  ResourceClient* resource_;
  const FailurePolicy policy_;
  std::shared_ptr<spdlog::logger> logger_;

  LogicalClock clock_;

  mutable std::mutex mutex_;
  std::condition_variable held_cv_;
  PeerState st_;

  // Serializes local run_exclusive callers; never taken by inbound paths.
  std::mutex round_mutex_;

  std::atomic<int64_t> failed_rounds_{0};
  std::atomic<int64_t> violations_{0};
};

}  // namespace ramutex
