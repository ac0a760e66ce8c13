#include "mutex_engine.hpp"

#include <exception>
#include <map>
#include <stdexcept>
#include <thread>
#include <utility>

#include "logging.hpp"

namespace ramutex {

MutexEngine::MutexEngine(int self_id, const std::vector<PeerRecord>& peers,
                         PeerTransport* transport, ResourceClient* resource,
                         FailurePolicy policy)
    : self_id_(self_id),
      peers_(peers),
      transport_(transport),
      resource_(resource),
      policy_(policy),
      logger_(client_logger(self_id)) {
  if (transport_ == nullptr || resource_ == nullptr) {
    throw std::invalid_argument("MutexEngine needs a transport and a resource client");
  }
  bool self_listed = false;
  for (auto& p : peers_) {
    if (p.id == self_id_) self_listed = true;
  }
  if (!self_listed) {
    throw std::invalid_argument("peer set does not contain client " + std::to_string(self_id_));
  }
}

bool MutexEngine::is_known_peer(int peer_id) const {
  if (peer_id == self_id_) return false;
  for (auto& p : peers_) {
    if (p.id == peer_id) return true;
  }
  return false;
}

void MutexEngine::reject(const char* what, int peer_id, int64_t request_timestamp) {
  violations_.fetch_add(1);
  logger_->warn("[LT: {}] Protocol violation: ignoring {} from Client {} (TS: {})",
                clock_.now(), what, peer_id, request_timestamp);
}

// -------------------- Initiator --------------------

/*
 * run_exclusive
 * One complete protocol round around a single resource call. A resource
 * failure (including an exception thrown by the client) is turned into
 * ok=false for the caller; the release and the deferred grants still go out
 * so no other peer is starved by it.
 */
WorkResult MutexEngine::run_exclusive(const std::string& payload) {
  std::lock_guard<std::mutex> round(round_mutex_);

  int64_t request_ts = 0;
  if (!request_access(&request_ts)) {
    WorkResult busy;
    busy.message = "a request is already outstanding";
    return busy;
  }
  wait_until_held();

  WorkItem item;
  item.client_id = self_id_;
  item.payload = payload;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    item.request_number = st_.request_number;
  }
  item.timestamp = clock_.stamp();

  logger_->info("[LT: {}] Sending to resource: '{}'", clock_.now(), payload);
  WorkResult result;
  try {
    result = resource_->submit_work(item);
  } catch (const std::exception& e) {
    result.ok = false;
    result.message = e.what();
  }
  if (result.timestamp > 0 && LogicalClock::valid_remote(result.timestamp)) {
    clock_.observe(result.timestamp);
  }

  if (result.ok) {
    logger_->info("[LT: {}] Resource confirmed: {}", clock_.now(), result.message);
  } else {
    failed_rounds_.fetch_add(1);
    logger_->warn("[LT: {}] Resource failed: {}", clock_.now(), result.message);
  }

  release();
  return result;
}

bool MutexEngine::request_access(int64_t* timestamp) {
  AccessRequest req;
  std::vector<int> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (st_.state != MutexState::kReleased) {
      logger_->warn("[LT: {}] request_access while {}", clock_.now(), to_string(st_.state));
      return false;
    }
    st_.request_number++;
    st_.request_timestamp = clock_.stamp();
    st_.awaiting.clear();
    for (auto& p : peers_) {
      if (p.id != self_id_) st_.awaiting.insert(p.id);
    }
    st_.state = st_.awaiting.empty() ? MutexState::kHeld : MutexState::kWanted;

    req.requester_id = self_id_;
    req.timestamp = st_.request_timestamp;
    req.request_number = st_.request_number;
    targets.assign(st_.awaiting.begin(), st_.awaiting.end());
  }

  logger_->info("[LT: {}] Requesting critical section (Request #{}, TS: {})", clock_.now(),
                req.request_number, req.timestamp);
  if (timestamp != nullptr) *timestamp = req.timestamp;

  broadcast_request(req, targets);
  return true;
}

/*
 * broadcast_request
 * Sends the request to every other peer as independent calls, one thread
 * per peer, and feeds each answer into receive_reply(). A grant arriving
 * here and a deferred grant arriving through receive_release() are
 * accounted identically.
 */
void MutexEngine::broadcast_request(const AccessRequest& req, const std::vector<int>& targets) {
  std::vector<std::thread> ths;
  ths.reserve(targets.size());
  for (int peer_id : targets) {
    ths.emplace_back([this, peer_id, &req] {
      AccessReply reply;
      if (!transport_->request_access(peer_id, req, &reply)) {
        on_request_failure(peer_id, req.timestamp);
        return;
      }
      receive_reply(reply);
    });
  }
  for (auto& t : ths) t.join();
}

void MutexEngine::on_request_failure(int peer_id, int64_t request_timestamp) {
  logger_->warn("[LT: {}] ERROR requesting access from Client {}", clock_.now(), peer_id);
  if (policy_ == FailurePolicy::kStall) {
    logger_->warn("[LT: {}] Reply from Client {} stays outstanding (TS: {})", clock_.now(),
                  peer_id, request_timestamp);
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (st_.state != MutexState::kWanted || st_.request_timestamp != request_timestamp) return;
  if (st_.awaiting.erase(peer_id) == 0) return;
  logger_->warn("[LT: {}] Excluding Client {} from this round ({} replies pending)",
                clock_.now(), peer_id, st_.pending_reply_count());
  if (st_.awaiting.empty()) {
    st_.state = MutexState::kHeld;
    logger_->info("[LT: {}] Entering critical section", clock_.now());
    held_cv_.notify_all();
  }
}

bool MutexEngine::wait_until_held() {
  std::unique_lock<std::mutex> lock(mutex_);
  held_cv_.wait(lock, [this] { return st_.state != MutexState::kWanted; });
  return st_.state == MutexState::kHeld;
}

bool MutexEngine::wait_until_held(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  held_cv_.wait_for(lock, timeout, [this] { return st_.state != MutexState::kWanted; });
  return st_.state == MutexState::kHeld;
}

/*
 * release
 * HELD -> RELEASED. The deferred set is taken out under the lock in the
 * same step, so a request arriving after this point is granted right away
 * and never lands in the drained set. Grants are sent after unlocking.
 */
bool MutexEngine::release() {
  std::map<int, int64_t> deferred;
  ReleaseNotice base;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (st_.state != MutexState::kHeld) {
      logger_->warn("[LT: {}] release while {}", clock_.now(), to_string(st_.state));
      return false;
    }
    st_.state = MutexState::kReleased;
    deferred.swap(st_.deferred);
    st_.completed_rounds++;

    base.releaser_id = self_id_;
    base.request_number = st_.request_number;
    base.timestamp = clock_.stamp();
  }

  logger_->info("[LT: {}] Releasing critical section (TS: {}, deferred: {})", clock_.now(),
                base.timestamp, deferred.size());

  for (auto& d : deferred) {
    ReleaseNotice notice = base;
    notice.request_timestamp = d.second;
    if (transport_->release_access(d.first, notice)) {
      logger_->info("[LT: {}] Granted deferred request from Client {} (TS: {})", clock_.now(),
                    d.first, d.second);
    } else {
      logger_->warn("[LT: {}] Could not deliver deferred grant to Client {}", clock_.now(),
                    d.first);
    }
  }
  return true;
}

// -------------------- Responder --------------------

/*
 * receive_request
 * Grants when RELEASED, or when the incoming request goes before our own
 * outstanding one (lower timestamp, then lower id). Otherwise the requester
 * is deferred until our release.
 */
bool MutexEngine::receive_request(const AccessRequest& req, AccessReply* reply) {
  if (!is_known_peer(req.requester_id) || !LogicalClock::valid_remote(req.timestamp)) {
    reject("request", req.requester_id, req.timestamp);
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  clock_.observe(req.timestamp);

  const bool grant =
      st_.state == MutexState::kReleased ||
      has_priority(req.timestamp, req.requester_id, st_.request_timestamp, self_id_);

  reply->granter_id = self_id_;
  reply->request_timestamp = req.timestamp;
  reply->granted = grant;
  if (grant) {
    logger_->info("[LT: {}] GRANTED access to Client {} (TS: {})", clock_.now(),
                  req.requester_id, req.timestamp);
  } else {
    st_.deferred[req.requester_id] = req.timestamp;
    logger_->info("[LT: {}] DEFERRED access for Client {} (TS: {}, ours: {})", clock_.now(),
                  req.requester_id, req.timestamp, st_.request_timestamp);
  }
  reply->timestamp = clock_.stamp();
  return true;
}

// -------------------- Reply collector --------------------

bool MutexEngine::receive_reply(const AccessReply& reply) {
  if (!is_known_peer(reply.granter_id)) {
    reject("reply", reply.granter_id, reply.request_timestamp);
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!reply.granted) {
    // A deferral may still be in flight when the matching deferred grant
    // has already made us HELD; any other round is stale.
    if (st_.state == MutexState::kReleased || reply.request_timestamp != st_.request_timestamp ||
        !LogicalClock::valid_remote(reply.timestamp)) {
      reject("deferral", reply.granter_id, reply.request_timestamp);
      return false;
    }
    clock_.observe(reply.timestamp);
    logger_->info("[LT: {}] Client {} deferred our request (TS: {})", clock_.now(),
                  reply.granter_id, reply.request_timestamp);
    return true;
  }
  return accept_grant_locked(reply.granter_id, reply.request_timestamp, reply.timestamp,
                             "GRANT");
}

bool MutexEngine::receive_release(const ReleaseNotice& notice) {
  if (!is_known_peer(notice.releaser_id)) {
    reject("release", notice.releaser_id, notice.request_timestamp);
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  return accept_grant_locked(notice.releaser_id, notice.request_timestamp, notice.timestamp,
                             "deferred GRANT");
}

// Requires mutex_. Counts one reply towards the outstanding request and
// performs WANTED -> HELD on the last one.
bool MutexEngine::accept_grant_locked(int granter_id, int64_t request_timestamp,
                                      int64_t sender_ts, const char* kind) {
  if (st_.state != MutexState::kWanted || request_timestamp != st_.request_timestamp ||
      st_.awaiting.count(granter_id) == 0 || !LogicalClock::valid_remote(sender_ts)) {
    reject(kind, granter_id, request_timestamp);
    return false;
  }

  st_.awaiting.erase(granter_id);
  clock_.observe(sender_ts);
  const int expected = peer_count() - 1;
  logger_->info("[LT: {}] Received {} from Client {} ({}/{})", clock_.now(), kind, granter_id,
                expected - st_.pending_reply_count(), expected);

  if (st_.awaiting.empty()) {
    st_.state = MutexState::kHeld;
    logger_->info("[LT: {}] Received all replies, entering critical section", clock_.now());
    held_cv_.notify_all();
  }
  return true;
}

PeerSnapshot MutexEngine::snapshot() const {
  PeerSnapshot out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.state = st_;
    out.clock = clock_.now();
  }
  out.failed_rounds = failed_rounds_.load();
  out.protocol_violations = violations_.load();
  return out;
}

MutexState MutexEngine::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return st_.state;
}

}  // namespace ramutex
