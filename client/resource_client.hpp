#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "ramutex.grpc.pb.h"

namespace ramutex {

struct WorkItem {
  int client_id = 0;
  std::string payload;
  int64_t timestamp = 0;
  int64_t request_number = 0;
};

// Outcome of one protected operation. ok=false is a ResourceError and is
// reported to the originator only.
struct WorkResult {
  bool ok = false;
  std::string message;
  int64_t timestamp = 0;  // resource's clock in the response, 0 if none
};

// ResourceClient submits work to the externally owned resource. The call
// is synchronous and bounds the duration of HELD.
class ResourceClient {
public:
  virtual ~ResourceClient() = default;
  virtual WorkResult submit_work(const WorkItem& item) = 0;
};

// GrpcResourceClient drives the print server's PrintingService.
class GrpcResourceClient : public ResourceClient {
public:
  GrpcResourceClient(const std::string& addr, std::chrono::milliseconds deadline);

  WorkResult submit_work(const WorkItem& item) override;

private:
  std::string addr_;
  std::unique_ptr<wire::PrintingService::Stub> stub_;
  std::chrono::milliseconds deadline_;
};

}  // namespace ramutex
