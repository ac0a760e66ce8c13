#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "mutex_engine.hpp"
#include "peer_state.hpp"

namespace ramutex {

// Everything a peer needs at construction. Immutable afterwards.
struct PeerConfig {
  int self_id = 0;
  std::vector<PeerRecord> peers;  // full set, self included
  std::string printer_addr;
  FailurePolicy policy = FailurePolicy::kStall;
  std::chrono::milliseconds rpc_deadline{5000};
  std::chrono::milliseconds print_deadline{10000};
};

// Command line of the client executable, flags already removed from the
// positional arguments.
struct ClientOptions {
  PeerConfig config;
  std::string mode;  // run, once or load
  double min_s = 5.0;
  double max_s = 15.0;
  std::string message;
  int count = 0;
};

// Parses "<peers.txt> <self_id> <printer ip:port> <mode> [mode args]" with
// "--exclude-failed" allowed anywhere. Loads the peers file. Throws
// std::invalid_argument for a malformed command line and std::runtime_error
// for a bad peers file or a self id outside it.
ClientOptions parse_client_args(std::vector<std::string> args);

// Parses a peers file: one "id host:port" per line. Blank lines and lines
// starting with '#' are skipped. Throws std::runtime_error on a malformed
// line, a non-positive or duplicate id, or an empty file.
std::vector<PeerRecord> parse_peers(const std::string& text);
std::vector<PeerRecord> load_peers(const std::string& path);

// Looks up self in peers. Throws std::runtime_error if missing.
const PeerRecord& find_peer(const std::vector<PeerRecord>& peers, int id);

}  // namespace ramutex
