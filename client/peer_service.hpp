#pragma once
#include <grpcpp/grpcpp.h>

#include "mutex_engine.hpp"
#include "ramutex.grpc.pb.h"

namespace ramutex {

// MutualExclusionServiceImpl is the responder side of a peer. It converts
// each RPC into the domain type and hands it to the engine, which does all
// locking. The handlers never wait for the local peer's own request.
class MutualExclusionServiceImpl final : public wire::MutualExclusionService::Service {
public:
  explicit MutualExclusionServiceImpl(MutexEngine* engine) : engine_(engine) {}

  grpc::Status RequestAccess(grpc::ServerContext*, const wire::AccessRequest* req,
                             wire::AccessResponse* reply) override;

  // A release from a peer that deferred us is its grant for our request.
  // Releases that do not match an outstanding deferral are acknowledged
  // with acknowledged=false and have no effect.
  grpc::Status ReleaseAccess(grpc::ServerContext*, const wire::ReleaseMessage* req,
                             wire::ReleaseResponse* reply) override;

private:
  MutexEngine* engine_;
};

}  // namespace ramutex
