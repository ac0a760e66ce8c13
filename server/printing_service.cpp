#include "printing_service.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

int PrintingServiceImpl::pick_delay_ms() {
    if (options_.max_delay_ms <= options_.min_delay_ms) return options_.min_delay_ms;
    std::lock_guard<std::mutex> lock(state_->state_mutex);
    std::uniform_int_distribution<int> dist(options_.min_delay_ms, options_.max_delay_ms);
    return dist(state_->rng);
}

bool PrintingServiceImpl::roll_failure() {
    if (options_.fail_rate <= 0.0) return false;
    std::lock_guard<std::mutex> lock(state_->state_mutex);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(state_->rng) < options_.fail_rate;
}

// SendToPrinter prints one job. A job arriving while another one is still
// printing is a mutual-exclusion violation on the clients' side; it is
// still printed, but logged and counted.
grpc::Status PrintingServiceImpl::SendToPrinter(grpc::ServerContext*,
                                                const ramutex::wire::PrintRequest* req,
                                                ramutex::wire::PrintResponse* reply) {
    if (!ramutex::LogicalClock::valid_remote(req->lamport_timestamp())) {
        spdlog::warn("Rejecting job from client {} with timestamp {}", req->client_id(),
                     req->lamport_timestamp());
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "invalid lamport_timestamp");
    }
    state_->clock.observe(req->lamport_timestamp());

    {
        std::lock_guard<std::mutex> lock(state_->state_mutex);
        state_->active_jobs++;
        if (state_->active_jobs > 1) {
            state_->overlap_count++;
            spdlog::error("OVERLAP: job from client {} (request #{}) while {} other job(s) print",
                          req->client_id(), req->request_number(), state_->active_jobs - 1);
        }
    }

    bool ok = false;
    std::string confirmation;
    if (req->message_content().empty()) {
        confirmation = "Rejected empty document from client " + std::to_string(req->client_id());
    } else if (roll_failure()) {
        confirmation = "Printer jammed on job from client " + std::to_string(req->client_id());
    } else {
        int delay = pick_delay_ms();
        std::ostringstream out;
        out << "\n============================================================\n"
            << "[TS: " << req->lamport_timestamp() << "] CLIENT " << req->client_id()
            << " (Request #" << req->request_number() << "):\n"
            << "  " << req->message_content() << "\n"
            << "============================================================\n"
            << "Printing... (simulating " << delay << "ms delay)\n";
        std::cout << out.str() << std::flush;

        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        ok = true;
        confirmation = "Print completed for client " + std::to_string(req->client_id());
    }

    int64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(state_->state_mutex);
        state_->active_jobs--;
        if (ok) {
            total = ++state_->print_count;
        } else {
            state_->failed_count++;
        }
    }

    if (ok) {
        std::cout << "Print completed! Total prints: " << total << "\n" << std::flush;
    } else {
        spdlog::warn("{}", confirmation);
    }

    reply->set_success(ok);
    reply->set_confirmation_message(confirmation);
    reply->set_lamport_timestamp(state_->clock.stamp());
    return grpc::Status::OK;
}
