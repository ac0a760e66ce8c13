#include "mutex_engine.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "test_support.hpp"

using namespace std::chrono_literals;
using ramutex::AccessReply;
using ramutex::AccessRequest;
using ramutex::FailurePolicy;
using ramutex::MutexEngine;
using ramutex::MutexState;
using ramutex::ReleaseNotice;
using testing_support::Check;
using testing_support::Cluster;
using testing_support::MakePeers;
using testing_support::RecordingResource;
using testing_support::ScriptedTransport;

namespace {

  void TestPriorityRule() {
    Check(ramutex::has_priority(3, 9, 4, 1), "lower timestamp wins regardless of id");
    Check(!ramutex::has_priority(4, 1, 3, 9), "higher timestamp loses regardless of id");
    Check(ramutex::has_priority(5, 1, 5, 2), "equal timestamps: lower id wins");
    Check(!ramutex::has_priority(5, 2, 5, 1), "equal timestamps: higher id loses");
    Check(!ramutex::has_priority(5, 2, 5, 2), "a request never beats itself");
  }

  void TestGrantWhileReleased() {
    ScriptedTransport transport;
    RecordingResource resource;
    MutexEngine engine(2, MakePeers({1, 2, 3}), &transport, &resource);

    AccessReply reply;
    Check(engine.receive_request({1, 100, 1}, &reply), "known requester accepted");
    Check(reply.granted, "RELEASED peer grants immediately");
    Check(reply.granter_id == 2, "reply names the granter");
    Check(reply.request_timestamp == 100, "reply names the request it answers");
    Check(engine.clock().now() >= 101, "receiving a request observes its timestamp");
    Check(reply.timestamp == engine.clock().now(), "reply carries the sender's clock");
    Check(engine.snapshot().state.deferred.empty(), "nothing deferred");
  }

  void TestUnknownRequesterIsRejected() {
    ScriptedTransport transport;
    RecordingResource resource;
    MutexEngine engine(1, MakePeers({1, 2}), &transport, &resource);

    AccessReply reply;
    Check(!engine.receive_request({9, 50, 1}, &reply), "unknown id rejected");
    Check(!engine.receive_request({1, 50, 1}, &reply), "request from self rejected");
    Check(engine.clock().now() == 0, "rejected request does not move the clock");
    Check(engine.snapshot().protocol_violations == 2, "both counted as violations");
  }

  // Peers {1,2,3}: peer 3 holds with timestamp 2; peer 1 asks with
  // timestamp 4 while it holds and must wait for peer 3's release. Each
  // engine sits on a scripted transport so the messages between them are
  // handed over one by one.
  void TestRequestDuringHoldIsDeferredUntilRelease() {
    const auto peers = MakePeers({1, 2, 3});
    RecordingResource resource;
    ScriptedTransport net1, net3;
    net1.Script(3, ScriptedTransport::Answer::kDefer);
    MutexEngine p1(1, peers, &net1, &resource);
    MutexEngine p3(3, peers, &net3, &resource);

    p3.clock().tick();
    int64_t ts3 = 0;
    Check(p3.request_access(&ts3), "peer 3 requests");
    Check(ts3 == 2, "peer 3 request stamped 2");
    Check(p3.state() == MutexState::kHeld, "peer 3 HELD after both grants");

    p1.clock().observe(ts3);
    int64_t ts1 = 0;
    Check(p1.request_access(&ts1), "peer 1 requests");
    Check(ts1 == 4, "peer 1 request stamped 4");
    Check(p1.state() == MutexState::kWanted, "peer 1 waits");
    auto s1 = p1.snapshot();
    Check(s1.state.pending_reply_count() == 1 && s1.state.awaiting.count(3) == 1,
          "only peer 3's reply is outstanding");

    AccessReply answer;
    Check(p3.receive_request({1, ts1, 1}, &answer), "peer 3 hears peer 1");
    Check(!answer.granted && answer.request_timestamp == 4, "peer 3 defers timestamp 4");
    auto s3 = p3.snapshot();
    Check(s3.state.deferred.size() == 1 && s3.state.deferred.at(1) == 4,
          "peer 3 deferred peer 1 with its request timestamp");
    Check(!p1.wait_until_held(50ms), "peer 1 not granted while peer 3 holds");

    Check(p3.release(), "peer 3 releases");
    Check(p3.snapshot().state.deferred.empty(), "deferred set drained at release");
    auto sent = net3.Releases();
    Check(sent.size() == 1 && sent[0].first == 1 && sent[0].second.request_timestamp == 4,
          "one deferred grant to peer 1");
    Check(p1.receive_release(sent[0].second), "peer 1 accepts the deferred grant");
    Check(p1.state() == MutexState::kHeld, "peer 1 HELD after peer 3");
    Check(p1.release(), "peer 1 releases");
  }

  // Peers 1 and 2 request with the same timestamp. Peer 2 grants, peer 1
  // defers peer 2 until it releases.
  void TestEqualTimestampsBrokenByLowerId() {
    Cluster c({1, 2});
    auto& p1 = c.Engine(1);
    auto& p2 = c.Engine(2);
    p1.clock().observe(3);
    p2.clock().observe(3);

    c.net.CloseGate();
    int64_t ts1 = 0, ts2 = 0;
    std::thread t1([&] { p1.request_access(&ts1); });
    std::thread t2([&] { p2.request_access(&ts2); });
    Check(testing_support::WaitFor([&] {
            return p1.state() == MutexState::kWanted && p2.state() == MutexState::kWanted;
          }),
          "both peers WANTED before any request is delivered");
    c.net.OpenGate();
    t1.join();
    t2.join();

    Check(ts1 == 5 && ts2 == 5, "both requests stamped 5");
    Check(p1.wait_until_held(1000ms), "peer 1 wins the tie");
    Check(p2.state() == MutexState::kWanted, "peer 2 still waiting");
    Check(p1.snapshot().state.deferred.count(2) == 1, "peer 1 deferred peer 2");

    Check(p1.release(), "peer 1 releases");
    Check(p2.wait_until_held(1000ms), "peer 2 granted after peer 1 releases");
    Check(p2.release(), "peer 2 releases");
  }

  void TestProtocolViolationsAreNoOps() {
    ScriptedTransport transport;
    transport.Script(2, ScriptedTransport::Answer::kDefer);
    transport.Script(3, ScriptedTransport::Answer::kDefer);
    RecordingResource resource;
    MutexEngine engine(1, MakePeers({1, 2, 3}), &transport, &resource);

    ReleaseNotice early{2, 1, 5, 1};
    Check(!engine.receive_release(early), "release before any request ignored");

    int64_t ts = 0;
    Check(engine.request_access(&ts), "request");
    Check(engine.state() == MutexState::kWanted, "both peers deferred us");
    const int64_t clock_before = engine.clock().now();

    AccessReply unknown{9, true, ts, 100};
    Check(!engine.receive_reply(unknown), "reply from unknown peer");
    ReleaseNotice stale{2, ts - 1, 100, 1};
    Check(!engine.receive_release(stale), "grant for another request");
    AccessReply from_self{1, true, ts, 100};
    Check(!engine.receive_reply(from_self), "reply from self");
    Check(engine.clock().now() == clock_before, "violations leave the clock alone");

    ReleaseNotice grant2{2, ts, 7, 1};
    Check(engine.receive_release(grant2), "deferred grant from peer 2 accepted");
    Check(!engine.receive_release(grant2), "duplicate grant from peer 2");
    AccessReply dup{2, true, ts, 8};
    Check(!engine.receive_reply(dup), "second reply from peer 2");

    auto s = engine.snapshot();
    Check(s.state.state == MutexState::kWanted, "still WANTED");
    Check(s.state.pending_reply_count() == 1 && s.state.awaiting.count(3) == 1,
          "only peer 3 outstanding");
    Check(s.protocol_violations == 6, "each violation counted once");

    ReleaseNotice grant3{3, ts, 9, 1};
    Check(engine.receive_release(grant3), "last grant accepted");
    Check(engine.state() == MutexState::kHeld, "HELD after last grant");
    Check(!engine.receive_release(grant3), "grant while HELD ignored");
    Check(engine.release(), "release");
    Check(transport.Releases().empty(), "nobody was deferred, no notices sent");
  }

  // Timestamps outside [0, kMaxTime) are refused before the clock sees them.
  void TestOutOfRangeTimestampsRejected() {
    const int64_t max = ramutex::LogicalClock::kMaxTime;
    ScriptedTransport transport;
    transport.Script(2, ScriptedTransport::Answer::kDefer);
    transport.Script(3, ScriptedTransport::Answer::kDefer);
    RecordingResource resource;
    MutexEngine engine(1, MakePeers({1, 2, 3}), &transport, &resource);

    AccessReply reply;
    Check(!engine.receive_request({2, -1, 1}, &reply), "negative request timestamp");
    Check(!engine.receive_request({2, max, 1}, &reply), "saturated request timestamp");
    Check(engine.clock().now() == 0, "refused requests leave the clock alone");
    Check(engine.snapshot().state.deferred.empty(), "nothing deferred");

    int64_t ts = 0;
    Check(engine.request_access(&ts), "request");
    const int64_t clock_before = engine.clock().now();

    Check(!engine.receive_release({2, ts, -3, 1}), "grant with negative clock");
    Check(!engine.receive_release({2, ts, max, 1}), "grant with saturated clock");
    AccessReply huge{3, true, ts, max};
    Check(!engine.receive_reply(huge), "reply with saturated clock");
    Check(engine.clock().now() == clock_before, "clock unchanged");

    auto s = engine.snapshot();
    Check(s.state.pending_reply_count() == 2, "no reply counted");
    Check(s.protocol_violations == 5, "each out of range timestamp counted");

    Check(engine.receive_release({2, ts, clock_before + 1, 1}), "valid grant from peer 2");
    Check(engine.receive_release({3, ts, clock_before + 2, 1}), "valid grant from peer 3");
    Check(engine.state() == MutexState::kHeld, "HELD once both grants arrive");
  }

  // A deferral must answer the outstanding request; one from an earlier
  // round or arriving while RELEASED is dropped without touching the clock.
  void TestStaleDeferralsIgnored() {
    ScriptedTransport transport;
    RecordingResource resource;
    MutexEngine engine(1, MakePeers({1, 2}), &transport, &resource);

    int64_t first = 0;
    Check(engine.request_access(&first), "first round");
    Check(engine.release(), "first round released");

    const int64_t released_clock = engine.clock().now();
    AccessReply late{2, false, first, 500};
    Check(!engine.receive_reply(late), "deferral while RELEASED");
    Check(engine.clock().now() == released_clock, "clock unchanged while RELEASED");

    transport.Script(2, ScriptedTransport::Answer::kDefer);
    int64_t second = 0;
    Check(engine.request_access(&second), "second round");
    Check(engine.state() == MutexState::kWanted, "peer 2 defers the second round");
    const int64_t wanted_clock = engine.clock().now();

    Check(!engine.receive_reply(late), "deferral for the first round");
    AccessReply negative{2, false, second, -1};
    Check(!engine.receive_reply(negative), "deferral with negative clock");
    Check(engine.clock().now() == wanted_clock, "clock unchanged while WANTED");

    AccessReply current{2, false, second, wanted_clock + 1};
    Check(engine.receive_reply(current), "deferral for the current round accepted");
    Check(engine.clock().now() == wanted_clock + 2, "current deferral observed");
    Check(engine.snapshot().protocol_violations == 3, "three stale deferrals counted");
    Check(engine.snapshot().state.pending_reply_count() == 1, "a deferral is not a grant");
  }

  // Every requester deferred during a hold gets exactly one grant, at the
  // release and not before it.
  void TestDeferredDrainCompleteness() {
    ScriptedTransport transport;
    RecordingResource resource;
    MutexEngine engine(1, MakePeers({1, 2, 3, 4}), &transport, &resource);

    int64_t ts = 0;
    Check(engine.request_access(&ts), "request");
    Check(engine.state() == MutexState::kHeld, "all scripted peers grant");

    AccessReply r2, r3, r4;
    Check(engine.receive_request({2, ts + 10, 1}, &r2) && !r2.granted, "peer 2 deferred");
    Check(engine.receive_request({3, ts + 11, 4}, &r3) && !r3.granted, "peer 3 deferred");
    Check(engine.receive_request({4, ts + 12, 2}, &r4) && !r4.granted, "peer 4 deferred");
    Check(transport.Releases().empty(), "no grant before release");

    Check(engine.release(), "release");
    auto sent = transport.Releases();
    Check(sent.size() == 3, "one notice per deferred requester");
    std::map<int, int64_t> by_peer;
    for (auto& s : sent) {
      Check(s.second.releaser_id == 1, "notice names the releaser");
      by_peer[s.first] = s.second.request_timestamp;
    }
    Check(by_peer.size() == 3, "no requester granted twice");
    Check(by_peer[2] == ts + 10 && by_peer[3] == ts + 11 && by_peer[4] == ts + 12,
          "each notice answers the deferred request");
    Check(engine.snapshot().state.deferred.empty(), "deferred set empty");

    AccessReply after;
    Check(engine.receive_request({2, ts + 20, 2}, &after) && after.granted,
          "request after release granted at once");
    Check(!engine.release(), "second release refused");
    Check(transport.Releases().size() == 3, "no extra notices");
  }

  void TestHigherPriorityRequestGrantedWhileWanted() {
    ScriptedTransport transport;
    transport.Script(2, ScriptedTransport::Answer::kDefer);
    RecordingResource resource;
    MutexEngine engine(3, MakePeers({2, 3}), &transport, &resource);
    engine.clock().observe(8);

    int64_t ts = 0;
    Check(engine.request_access(&ts), "request");
    AccessReply older;
    Check(engine.receive_request({2, ts - 1, 1}, &older) && older.granted,
          "older request granted while WANTED");
    AccessReply tie;
    Check(engine.receive_request({2, ts, 2}, &tie) && tie.granted,
          "equal timestamp from lower id granted");
    AccessReply newer;
    Check(engine.receive_request({2, ts + 1, 3}, &newer) && !newer.granted,
          "newer request deferred");
  }

  void TestFailurePolicies() {
    {
      ScriptedTransport transport;
      transport.Script(3, ScriptedTransport::Answer::kUnreachable);
      RecordingResource resource;
      MutexEngine engine(1, MakePeers({1, 2, 3}), &transport, &resource, FailurePolicy::kStall);
      Check(engine.request_access(), "request");
      Check(!engine.wait_until_held(100ms), "stall: unreachable peer blocks the round");
      auto s = engine.snapshot();
      Check(s.state.state == MutexState::kWanted && s.state.awaiting.count(3) == 1,
            "stall: peer 3 still awaited");
    }
    {
      ScriptedTransport transport;
      transport.Script(3, ScriptedTransport::Answer::kUnreachable);
      RecordingResource resource;
      MutexEngine engine(1, MakePeers({1, 2, 3}), &transport, &resource,
                         FailurePolicy::kExclude);
      Check(engine.request_access(), "request");
      Check(engine.wait_until_held(1000ms), "exclude: round completes without peer 3");
      Check(engine.release(), "release");

      transport.Script(3, ScriptedTransport::Answer::kGrant);
      Check(engine.request_access(), "next round");
      Check(engine.state() == MutexState::kHeld, "exclusion lasts one round only");
      Check(engine.release(), "release");
    }
  }

  // A resource that receives a competing request while it runs and then
  // fails. The failure reaches the caller; the release still happens.
  class FailingResource : public ramutex::ResourceClient {
  public:
    explicit FailingResource(bool throw_instead) : throw_instead_(throw_instead) {}
    MutexEngine* engine = nullptr;
    AccessReply competing;

    ramutex::WorkResult submit_work(const ramutex::WorkItem& item) override {
      engine->receive_request({2, item.timestamp + 5, 1}, &competing);
      if (throw_instead_) throw std::runtime_error("printer on fire");
      ramutex::WorkResult r;
      r.ok = false;
      r.message = "out of paper";
      return r;
    }

  private:
    bool throw_instead_;
  };

  void TestResourceFailureStillReleases() {
    for (bool throw_instead : {false, true}) {
      ScriptedTransport transport;
      FailingResource resource(throw_instead);
      MutexEngine engine(1, MakePeers({1, 2}), &transport, &resource);
      resource.engine = &engine;

      auto result = engine.run_exclusive("quarterly report");
      Check(!result.ok, "failure reported to the originator");
      Check(result.message == (throw_instead ? "printer on fire" : "out of paper"),
            "failure message kept");
      Check(!resource.competing.granted, "competing request deferred while HELD");

      auto s = engine.snapshot();
      Check(s.state.state == MutexState::kReleased, "released after failure");
      Check(s.state.completed_rounds == 1 && s.failed_rounds == 1, "round counted as failed");
      auto sent = transport.Releases();
      Check(sent.size() == 1 && sent[0].first == 2, "deferred peer still granted");
    }
  }

  void TestSinglePeerAndMisuse() {
    ScriptedTransport transport;
    RecordingResource resource;
    MutexEngine alone(5, MakePeers({5}), &transport, &resource);
    auto r = alone.run_exclusive("solo");
    Check(r.ok, "a lone peer enters without replies");
    Check(alone.snapshot().state.completed_rounds == 1, "one round");

    MutexEngine engine(1, MakePeers({1, 2}), &transport, &resource);
    Check(!engine.release(), "release while RELEASED refused");
    Check(engine.request_access(), "first request");
    Check(!engine.request_access(), "second request while HELD refused");
    Check(engine.release(), "release");

    bool threw = false;
    try {
      MutexEngine bad(7, MakePeers({1, 2}), &transport, &resource);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    Check(threw, "self must be in the peer set");
  }

}  // namespace

int main() {
  spdlog::set_level(spdlog::level::warn);
  TestPriorityRule();
  TestGrantWhileReleased();
  TestUnknownRequesterIsRejected();
  TestRequestDuringHoldIsDeferredUntilRelease();
  TestEqualTimestampsBrokenByLowerId();
  TestProtocolViolationsAreNoOps();
  TestOutOfRangeTimestampsRejected();
  TestStaleDeferralsIgnored();
  TestDeferredDrainCompleteness();
  TestHigherPriorityRequestGrantedWhileWanted();
  TestFailurePolicies();
  TestResourceFailureStillReleases();
  TestSinglePeerAndMisuse();
  std::cout << "mutex engine tests passed" << std::endl;
  return 0;
}
