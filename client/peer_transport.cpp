#include "peer_transport.hpp"

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

namespace ramutex {

GrpcPeerTransport::GrpcPeerTransport(const std::vector<PeerRecord>& peers, int self_id,
                                     std::chrono::milliseconds deadline)
    : deadline_(deadline) {
  for (auto& p : peers) {
    if (p.id == self_id) continue;
    auto ch = grpc::CreateChannel(p.addr, grpc::InsecureChannelCredentials());
    stubs_[p.id] = wire::MutualExclusionService::NewStub(ch);
  }
}

wire::MutualExclusionService::Stub* GrpcPeerTransport::stub_for(int peer_id) {
  auto it = stubs_.find(peer_id);
  return it == stubs_.end() ? nullptr : it->second.get();
}

/*
 * request_access / release_access
 * Each helper issues a single RPC with the configured deadline and copies
 * reply fields into the domain type. A missing stub, a failed status or a
 * refused release all count as a transport failure for the caller.
 */
bool GrpcPeerTransport::request_access(int peer_id, const AccessRequest& req,
                                       AccessReply* reply) {
  auto* stub = stub_for(peer_id);
  if (stub == nullptr) return false;

  grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);
  wire::AccessRequest msg;
  msg.set_client_id(req.requester_id);
  msg.set_lamport_timestamp(req.timestamp);
  msg.set_request_number(req.request_number);
  wire::AccessResponse rep;
  auto s = stub->RequestAccess(&ctx, msg, &rep);
  if (!s.ok()) {
    spdlog::warn("RequestAccess to client {} failed: {} ({})", peer_id, s.error_message(),
                 static_cast<int>(s.error_code()));
    return false;
  }
  reply->granter_id = rep.granter_id();
  reply->granted = rep.access_granted();
  reply->request_timestamp = rep.request_timestamp();
  reply->timestamp = rep.lamport_timestamp();
  return true;
}

bool GrpcPeerTransport::release_access(int peer_id, const ReleaseNotice& notice) {
  auto* stub = stub_for(peer_id);
  if (stub == nullptr) return false;

  grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);
  wire::ReleaseMessage msg;
  msg.set_client_id(notice.releaser_id);
  msg.set_request_timestamp(notice.request_timestamp);
  msg.set_lamport_timestamp(notice.timestamp);
  msg.set_request_number(notice.request_number);
  wire::ReleaseResponse rep;
  auto s = stub->ReleaseAccess(&ctx, msg, &rep);
  if (!s.ok()) {
    spdlog::warn("ReleaseAccess to client {} failed: {} ({})", peer_id, s.error_message(),
                 static_cast<int>(s.error_code()));
    return false;
  }
  return rep.acknowledged();
}

}  // namespace ramutex
