#include "peer_service.hpp"

#include <string>

namespace ramutex {

grpc::Status MutualExclusionServiceImpl::RequestAccess(grpc::ServerContext*,
                                                       const wire::AccessRequest* req,
                                                       wire::AccessResponse* reply) {
  AccessRequest in;
  in.requester_id = req->client_id();
  in.timestamp = req->lamport_timestamp();
  in.request_number = req->request_number();

  AccessReply out;
  if (!engine_->receive_request(in, &out)) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "refused request from client " + std::to_string(req->client_id()));
  }
  reply->set_access_granted(out.granted);
  reply->set_granter_id(out.granter_id);
  reply->set_request_timestamp(out.request_timestamp);
  reply->set_lamport_timestamp(out.timestamp);
  return grpc::Status::OK;
}

grpc::Status MutualExclusionServiceImpl::ReleaseAccess(grpc::ServerContext*,
                                                       const wire::ReleaseMessage* req,
                                                       wire::ReleaseResponse* reply) {
  ReleaseNotice in;
  in.releaser_id = req->client_id();
  in.request_timestamp = req->request_timestamp();
  in.timestamp = req->lamport_timestamp();
  in.request_number = req->request_number();

  reply->set_acknowledged(engine_->receive_release(in));
  reply->set_lamport_timestamp(engine_->clock().now());
  return grpc::Status::OK;
}

}  // namespace ramutex
