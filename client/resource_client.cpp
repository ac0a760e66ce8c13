#include "resource_client.hpp"

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

namespace ramutex {

GrpcResourceClient::GrpcResourceClient(const std::string& addr,
                                       std::chrono::milliseconds deadline)
    : addr_(addr),
      stub_(wire::PrintingService::NewStub(
          grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()))),
      deadline_(deadline) {}

WorkResult GrpcResourceClient::submit_work(const WorkItem& item) {
  grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);
  wire::PrintRequest req;
  req.set_client_id(item.client_id);
  req.set_message_content(item.payload);
  req.set_lamport_timestamp(item.timestamp);
  req.set_request_number(item.request_number);
  wire::PrintResponse rep;

  WorkResult out;
  auto s = stub_->SendToPrinter(&ctx, req, &rep);
  if (!s.ok()) {
    spdlog::warn("SendToPrinter at {} failed: {}", addr_, s.error_message());
    out.message = "print server unreachable: " + s.error_message();
    return out;
  }
  out.ok = rep.success();
  out.message = rep.confirmation_message();
  out.timestamp = rep.lamport_timestamp();
  return out;
}

}  // namespace ramutex
