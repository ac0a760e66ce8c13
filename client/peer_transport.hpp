#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <vector>

#include "peer_state.hpp"
#include "ramutex.grpc.pb.h"

namespace ramutex {

// PeerTransport delivers point-to-point protocol calls to other peers.
// Each call is independent; a broadcast is N-1 of them. Methods return false
// when the peer could not be reached (TransportError).
class PeerTransport {
public:
  virtual ~PeerTransport() = default;

  virtual bool request_access(int peer_id, const AccessRequest& req, AccessReply* reply) = 0;
  virtual bool release_access(int peer_id, const ReleaseNotice& notice) = 0;
};

// GrpcPeerTransport talks to MutualExclusionService on every other peer.
// One stub per peer, created up front and shared between threads.
class GrpcPeerTransport : public PeerTransport {
public:
  GrpcPeerTransport(const std::vector<PeerRecord>& peers, int self_id,
                    std::chrono::milliseconds deadline);

  bool request_access(int peer_id, const AccessRequest& req, AccessReply* reply) override;
  bool release_access(int peer_id, const ReleaseNotice& notice) override;

private:
  wire::MutualExclusionService::Stub* stub_for(int peer_id);

  std::map<int, std::unique_ptr<wire::MutualExclusionService::Stub>> stubs_;
  std::chrono::milliseconds deadline_;
};

}  // namespace ramutex
