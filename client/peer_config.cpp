#include "peer_config.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace ramutex {

/*
 * parse_peers
 * Input: the contents of a peers file. Output: the peer set in file order.
 * Unlike the address list of a single run, the peer set has to agree across
 * every process, so anything unexpected is an error rather than skipped.
 */
std::vector<PeerRecord> parse_peers(const std::string& text) {
  std::vector<PeerRecord> peers;
  std::set<int> seen;
  std::istringstream in(text);
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') continue;

    std::istringstream fields(line);
    PeerRecord p;
    std::string extra;
    if (!(fields >> p.id >> p.addr) || (fields >> extra)) {
      throw std::runtime_error("peers line " + std::to_string(line_no) +
                               ": expected '<id> <host:port>', got '" + line + "'");
    }
    if (p.id <= 0) {
      throw std::runtime_error("peers line " + std::to_string(line_no) +
                               ": id must be positive");
    }
    if (p.addr.find(':') == std::string::npos) {
      throw std::runtime_error("peers line " + std::to_string(line_no) + ": address '" +
                               p.addr + "' has no port");
    }
    if (!seen.insert(p.id).second) {
      throw std::runtime_error("peers line " + std::to_string(line_no) + ": duplicate id " +
                               std::to_string(p.id));
    }
    peers.push_back(p);
  }
  if (peers.empty()) throw std::runtime_error("no peers configured");
  return peers;
}

std::vector<PeerRecord> load_peers(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("cannot open peers file " + path);
  std::stringstream buf;
  buf << in.rdbuf();
  return parse_peers(buf.str());
}

const PeerRecord& find_peer(const std::vector<PeerRecord>& peers, int id) {
  for (auto& p : peers) {
    if (p.id == id) return p;
  }
  throw std::runtime_error("client " + std::to_string(id) + " is not in the peer set");
}

ClientOptions parse_client_args(std::vector<std::string> args) {
  ClientOptions opts;
  auto flag = std::find(args.begin(), args.end(), "--exclude-failed");
  if (flag != args.end()) {
    opts.config.policy = FailurePolicy::kExclude;
    args.erase(flag);
  }
  if (args.size() < 4) throw std::invalid_argument("missing arguments");

  opts.config.peers = load_peers(args[0]);
  opts.config.self_id = std::stoi(args[1]);
  opts.config.printer_addr = args[2];
  opts.mode = args[3];
  find_peer(opts.config.peers, opts.config.self_id);

  if (opts.mode == "run") {
    if (args.size() >= 6) {
      opts.min_s = std::stod(args[4]);
      opts.max_s = std::stod(args[5]);
    }
    if (opts.min_s < 0 || opts.max_s < opts.min_s) {
      throw std::invalid_argument("need 0 <= min_s <= max_s");
    }
  } else if (opts.mode == "once") {
    if (args.size() < 5) throw std::invalid_argument("once needs <message>");
    opts.message = args[4];
  } else if (opts.mode == "load") {
    if (args.size() < 5) throw std::invalid_argument("load needs <count>");
    opts.count = std::stoi(args[4]);
    if (opts.count <= 0) throw std::invalid_argument("load needs a positive <count>");
  } else {
    throw std::invalid_argument("unknown mode " + opts.mode);
  }
  return opts;
}

}  // namespace ramutex
