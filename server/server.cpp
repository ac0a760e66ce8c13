#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "printing_service.hpp"

using grpc::Server;
using grpc::ServerBuilder;

// RunServer boots the print server on the provided address until
// termination. The process owns a single PrinterState.
void RunServer(const std::string& address, const PrinterOptions& options) {
    PrinterState state;
    PrintingServiceImpl service(&state, options);

    ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::critical("Could not listen on {}", address);
        std::exit(1);
    }
    std::cout << "============================================================\n"
              << "PRINT SERVER - STARTED\n"
              << "Listening on " << address << " (delay " << options.min_delay_ms << "-"
              << options.max_delay_ms << "ms, fail rate " << options.fail_rate << ")\n"
              << "============================================================" << std::endl;
    server->Wait();
}

// Entry point: validates args and starts the server.
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: ./print_server <ip:port> [--delay <min_ms> <max_ms>] [--fail-rate <p>]\n";
        return 1;
    }

    PrinterOptions options;
    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--delay" && i + 2 < argc) {
                options.min_delay_ms = std::stoi(argv[++i]);
                options.max_delay_ms = std::stoi(argv[++i]);
            } else if (arg == "--fail-rate" && i + 1 < argc) {
                options.fail_rate = std::stod(argv[++i]);
            } else {
                std::cerr << "unknown option " << arg << "\n";
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "bad option value: " << e.what() << "\n";
        return 1;
    }
    if (options.min_delay_ms < 0 || options.max_delay_ms < options.min_delay_ms) {
        std::cerr << "--delay needs 0 <= min_ms <= max_ms\n";
        return 1;
    }

    spdlog::set_pattern("[%H:%M:%S.%e] [printer] %^%l%$ %v");
    RunServer(argv[1], options);
    return 0;
}
