#pragma once
#include <cstdint>
#include <mutex>
#include <random>

#include "lamport_clock.hpp"

// PrinterState stores all mutable data of the print server. The printer
// takes no part in mutual exclusion; it only counts jobs and notices when
// two of them overlap, which means the peers' protocol failed.
struct PrinterState {
    ramutex::LogicalClock clock;

    std::mutex state_mutex;
    int64_t print_count = 0;
    int64_t failed_count = 0;
    int active_jobs = 0;
    int64_t overlap_count = 0;
    std::mt19937_64 rng{std::random_device{}()};
};

// Tunables for the simulated printer.
struct PrinterOptions {
    int min_delay_ms = 2000;
    int max_delay_ms = 3000;
    double fail_rate = 0.0;  // probability a job is rejected
};
