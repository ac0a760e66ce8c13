#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "logging.hpp"
#include "mutex_engine.hpp"
#include "peer_config.hpp"
#include "peer_service.hpp"
#include "peer_transport.hpp"
#include "resource_client.hpp"

using namespace std::chrono_literals;
using namespace ramutex;

// -------------------- Global state --------------------

static std::atomic<bool> running{true};

static void on_signal(int) {
  running.store(false);
}

// Sleeps for up to d, waking early once the process is asked to stop.
static void interruptible_sleep(std::chrono::milliseconds d) {
  auto until = std::chrono::steady_clock::now() + d;
  while (running.load() && std::chrono::steady_clock::now() < until) {
    std::this_thread::sleep_for(100ms);
  }
}

static const std::vector<std::string> kDocuments = {
    "Monthly financial report",
    "Project requirements document",
    "Team meeting minutes",
    "Service agreement",
    "Pending task list",
    "Operating cost spreadsheet",
    "Instruction manual",
    "Commercial proposal",
    "Certificate of completion",
    "Statement of responsibility",
};

// -------------------- Modes --------------------

/*
 * run_automatic
 * Issues a coordinated print at a random interval in [min_s, max_s] until
 * interrupted, picking the document from a fixed list.
 */
void run_automatic(MutexEngine& engine, double min_s, double max_s) {
  auto log = client_logger(engine.self_id());
  std::mt19937_64 rng(std::random_device{}());
  std::uniform_real_distribution<double> interval(min_s, max_s);
  std::uniform_int_distribution<size_t> pick(0, kDocuments.size() - 1);

  int64_t total = 0;
  while (running.load()) {
    double wait = interval(rng);
    log->info("Next request in {:.1f}s...", wait);
    interruptible_sleep(std::chrono::milliseconds(static_cast<int64_t>(wait * 1000)));
    if (!running.load()) break;

    log->info("=== Initiating print request ===");
    WorkResult r = engine.run_exclusive(kDocuments[pick(rng)]);
    if (r.ok) total++;
    log->info("=== Print request completed (Total: {}) ===", total);
  }
}

// Per-run latency samples, collected by run_load.
struct LoadStats {
  std::vector<long long> lat_us;
  long long ok = 0;
  long long failed = 0;
};

/*
 * run_load
 * Issues count back-to-back coordinated prints and reports latency
 * percentiles of the full request-to-release cycle.
 */
void run_load(MutexEngine& engine, int count) {
  LoadStats stats;
  auto begin = std::chrono::steady_clock::now();
  for (int i = 0; i < count && running.load(); ++i) {
    auto start = std::chrono::steady_clock::now();
    WorkResult r = engine.run_exclusive("load job " + std::to_string(i + 1) + " from client " +
                                        std::to_string(engine.self_id()));
    auto end = std::chrono::steady_clock::now();
    stats.lat_us.push_back(
        std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
    if (r.ok) {
      stats.ok++;
    } else {
      stats.failed++;
    }
  }
  double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();

  auto percentile = [&](std::vector<long long>& v, double p) {
    if (v.empty()) return -1LL;
    std::sort(v.begin(), v.end());
    size_t idx = (size_t)(p * v.size());
    if (idx >= v.size()) idx = v.size() - 1;
    return v[idx];
  };

  std::cout << "---- Load Test Results ----\n";
  std::cout << "Client: " << engine.self_id() << " of " << engine.peer_count() << " peers\n";
  std::cout << "Rounds: " << stats.lat_us.size() << " (ok=" << stats.ok
            << ", failed=" << stats.failed << ") in " << secs << " seconds\n";
  if (secs > 0) std::cout << "Throughput: " << stats.lat_us.size() / secs << " rounds/sec\n";
  std::cout << "Round latency (us): p50=" << percentile(stats.lat_us, 0.50)
            << " p95=" << percentile(stats.lat_us, 0.95)
            << " p99=" << percentile(stats.lat_us, 0.99) << "\n";
}

void show_status(const MutexEngine& engine) {
  PeerSnapshot s = engine.snapshot();
  std::cout << "\n============================================================\n";
  std::cout << "CLIENT " << engine.self_id() << " STATUS\n";
  std::cout << "============================================================\n";
  std::cout << "Lamport Clock: " << s.clock << "\n";
  std::cout << "State: " << to_string(s.state.state) << "\n";
  std::cout << "Requests issued: " << s.state.request_number << "\n";
  std::cout << "Completed rounds: " << s.state.completed_rounds << " (resource failures: "
            << s.failed_rounds << ")\n";
  std::cout << "Deferred Requests: " << s.state.deferred.size() << "\n";
  std::cout << "Protocol violations ignored: " << s.protocol_violations << "\n";
  std::cout << "============================================================\n" << std::endl;
}

// -------------------- main() --------------------

static void usage() {
  std::cerr << "Usage:\n"
            << "  ./client <peers.txt> <self_id> <printer ip:port> run [min_s max_s] [--exclude-failed]\n"
            << "  ./client <peers.txt> <self_id> <printer ip:port> once <message> [--exclude-failed]\n"
            << "  ./client <peers.txt> <self_id> <printer ip:port> load <count> [--exclude-failed]\n"
            << "Without --exclude-failed a client waiting on an unreachable peer keeps\n"
            << "waiting for its reply and does not stop on Ctrl-C until it arrives.\n";
}

/*
 * main
 * Loads the peer set, starts this peer's MutualExclusionService, waits for
 * the other peers to come up and then runs the requested mode.
 */
int main(int argc, char** argv) {
  ClientOptions opts;
  try {
    opts = parse_client_args(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    usage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "config error: " << e.what() << "\n";
    return 1;
  }
  const PeerConfig& config = opts.config;
  const std::string& mode = opts.mode;

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  const PeerRecord& self = find_peer(config.peers, config.self_id);
  GrpcPeerTransport transport(config.peers, config.self_id, config.rpc_deadline);
  GrpcResourceClient printer(config.printer_addr, config.print_deadline);
  MutexEngine engine(config.self_id, config.peers, &transport, &printer, config.policy);
  MutualExclusionServiceImpl service(&engine);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(self.addr, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    std::cerr << "could not listen on " << self.addr << "\n";
    return 1;
  }

  std::cout << "============================================================\n"
            << "CLIENT " << config.self_id << " - STARTING\n"
            << "Listening on: " << self.addr << "\n"
            << "Print Server: " << config.printer_addr << "\n"
            << "Other Clients: " << config.peers.size() - 1 << "\n"
            << "Failure policy: "
            << (config.policy == FailurePolicy::kExclude ? "exclude" : "stall") << "\n"
            << "============================================================" << std::endl;

  // Give the other peers time to bind before the first broadcast.
  interruptible_sleep(2s);

  int rc = 0;
  if (mode == "run") {
    run_automatic(engine, opts.min_s, opts.max_s);
  } else if (mode == "once") {
    WorkResult r = engine.run_exclusive(opts.message);
    std::cout << (r.ok ? "PRINT ok: " : "PRINT failed: ") << r.message << "\n";
    rc = r.ok ? 0 : 3;
  } else {
    run_load(engine, opts.count);
  }

  // Keep answering peers that are still mid-round before going away.
  if (mode != "run") interruptible_sleep(5s);

  show_status(engine);
  server->Shutdown();
  return rc;
}
