#pragma once
#include <grpcpp/grpcpp.h>

#include "printer_state.hpp"
#include "ramutex.grpc.pb.h"

// PrintingServiceImpl is the "dumb" print server: it prints whatever it is
// sent, for as long as the simulated delay lasts, and reports back.
class PrintingServiceImpl final : public ramutex::wire::PrintingService::Service {
public:
    PrintingServiceImpl(PrinterState* state, PrinterOptions options)
        : state_(state), options_(options) {}

    grpc::Status SendToPrinter(grpc::ServerContext*, const ramutex::wire::PrintRequest* req,
                               ramutex::wire::PrintResponse* reply) override;

private:
    int pick_delay_ms();
    bool roll_failure();

    PrinterState* state_;
    PrinterOptions options_;
};
