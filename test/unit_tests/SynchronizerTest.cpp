#include "Synchronizer.hpp"

#include "FakeTimerHandler.hpp"
#include "RecordingListener.hpp"
#include "TestHeaders.hpp"

using namespace ssp;
using Catch::Approx;

namespace {
class SynchronizerFixture {
 public:
  SynchronizerFixture()
      : clock(new ManualClock(1000)), timers(new FakeTimerHandler(clock)) {}

  shared_ptr<Synchronizer> create(
      const string& site, shared_ptr<RecordingListener>* listener,
      const SynchronizerConfig& config = SynchronizerConfig()) {
    shared_ptr<Synchronizer> synchronizer(new Synchronizer(
        clock, timers, shared_ptr<SiteIdSource>(new FixedSiteIdSource(site)),
        config));
    listener->reset(new RecordingListener());
    synchronizer->addListener(*listener);
    return synchronizer;
  }

  shared_ptr<ManualClock> clock;
  shared_ptr<FakeTimerHandler> timers;
};

SyncUpdate decodeUpdate(const string& packet) {
  WireMessageView view;
  REQUIRE(WireCodec::decode(packet, &view));
  REQUIRE(view.type == MessageType::INPUT);
  SyncUpdate update;
  REQUIRE(update.ParseFromArray(view.payloadData, int(view.payloadLength)));
  return update;
}

void deliverAll(const vector<string>& packets, shared_ptr<Synchronizer> to) {
  for (const auto& packet : packets) {
    to->onRemoteUpdate(packet, 10);
  }
}

class OrderListener : public SynchronizerListener {
 public:
  OrderListener(int _id, vector<int>* _order) : id(_id), order(_order) {}
  void onOutput(const string& content, uint64_t position,
                double timestamp) override {
    order->push_back(id);
  }

  int id;
  vector<int>* order;
};
}  // namespace

TEST_CASE("Synchronizer local input", "[Synchronizer]") {
  SynchronizerFixture fixture;
  shared_ptr<RecordingListener> listener;
  shared_ptr<Synchronizer> a = fixture.create("A", &listener);

  a->sendInput("ab");
  REQUIRE(a->getState() == "ab");
  REQUIRE(a->getCursor() == 2);
  REQUIRE(listener->predictions.size() == 1);
  REQUIRE(listener->predictions[0].first == "ab");
  REQUIRE(listener->predictions[0].second == 0);

  REQUIRE(listener->sent.size() == 1);
  SyncUpdate update = decodeUpdate(listener->sent[0]);
  REQUIRE(update.sequence() == 0);
  REQUIRE_FALSE(update.critical());
  REQUIRE(update.operation().kind() == INSERT);
  REQUIRE(update.operation().text() == "ab");
  REQUIRE(update.operation().origin() == "A");
  REQUIRE(update.records_size() == 2);
  REQUIRE(update.records(0).value() == "a");
  REQUIRE(update.records(1).value() == "b");

  a->sendInput("c");
  REQUIRE(listener->predictions[1].second == 2);
  REQUIRE(decodeUpdate(listener->sent[1]).sequence() == 1);

  SynchronizerStats stats = a->getStats();
  REQUIRE(stats.siteId == "A");
  REQUIRE(stats.resolver.pendingCount == 2);
  REQUIRE(stats.buffer.visibleChars == 3);
  REQUIRE(stats.congestion.inFlight > 0);
}

TEST_CASE("Synchronizer replicas converge", "[Synchronizer]") {
  SynchronizerFixture fixture;
  shared_ptr<RecordingListener> listenerA;
  shared_ptr<RecordingListener> listenerB;
  shared_ptr<Synchronizer> a = fixture.create("A", &listenerA);
  shared_ptr<Synchronizer> b = fixture.create("B", &listenerB);

  a->sendInput("ab");
  b->sendInput("cd");
  deliverAll(listenerA->sent, b);
  deliverAll(listenerB->sent, a);

  REQUIRE(a->getState() == "cdab");
  REQUIRE(b->getState() == "cdab");
  REQUIRE(listenerA->updates.back() == "cdab");
  REQUIRE(listenerB->updates.back() == "cdab");

  // Each side asks its transport to acknowledge what it received
  REQUIRE(listenerB->acknowledgments.size() == 1);
  REQUIRE(listenerB->acknowledgments[0].sequence == 0);
  REQUIRE_FALSE(listenerB->acknowledgments[0].critical);

  a->acknowledge(0, 10);
  REQUIRE(a->getStats().resolver.pendingCount == 0);
  REQUIRE(a->getStats().congestion.inFlight == 0);

  // Unknown acknowledgments are ignored
  a->acknowledge(42, 10);
  a->acknowledgeCritical(42);
  REQUIRE(a->getStats().resolver.serverRevision == 2);
}

TEST_CASE("Synchronizer backspace", "[Synchronizer]") {
  SynchronizerFixture fixture;
  shared_ptr<RecordingListener> listenerA;
  shared_ptr<RecordingListener> listenerB;
  shared_ptr<Synchronizer> a = fixture.create("A", &listenerA);
  shared_ptr<Synchronizer> b = fixture.create("B", &listenerB);

  SECTION("Erases before the cursor") {
    a->sendInput("abc");
    a->sendInput("\x7f");
    REQUIRE(a->getState() == "ab");
    REQUIRE(a->getCursor() == 2);

    SyncUpdate erase = decodeUpdate(listenerA->sent.back());
    REQUIRE(erase.operation().kind() == DELETE);
    REQUIRE(erase.operation().position() == 2);
    REQUIRE(erase.operation().count() == 1);
    REQUIRE(erase.records(0).tombstoned());

    deliverAll(listenerA->sent, b);
    REQUIRE(b->getState() == "ab");
  }

  SECTION("Mixed with text") {
    a->sendInput("ab\x7f" "c");
    REQUIRE(a->getState() == "ac");
    REQUIRE(listenerA->sent.size() == 3);
    deliverAll(listenerA->sent, b);
    REQUIRE(b->getState() == "ac");
  }

  SECTION("Nothing to erase") {
    a->sendInput("\x7f");
    REQUIRE(a->getState() == "");
    REQUIRE(listenerA->sent.empty());
  }
}

TEST_CASE("Synchronizer critical input", "[Synchronizer]") {
  SynchronizerFixture fixture;
  shared_ptr<RecordingListener> listenerA;
  shared_ptr<RecordingListener> listenerB;
  shared_ptr<Synchronizer> a = fixture.create("A", &listenerA);
  shared_ptr<Synchronizer> b = fixture.create("B", &listenerB);

  a->sendInput("\r");
  // One copy per redundant path
  REQUIRE(listenerA->sent.size() == 3);
  REQUIRE(listenerA->sent[0] == listenerA->sent[1]);
  REQUIRE(listenerA->sent[1] == listenerA->sent[2]);
  SyncUpdate update = decodeUpdate(listenerA->sent[0]);
  REQUIRE(update.critical());
  REQUIRE(update.sequence() == 0);

  SECTION("Delivered") {
    deliverAll(listenerA->sent, b);
    REQUIRE(b->getState() == "\r");
    REQUIRE(b->getStats().duplicateUpdates == 2);
    REQUIRE(listenerB->acknowledgments.size() == 3);
    REQUIRE(listenerB->acknowledgments[0].critical);
    REQUIRE(listenerB->updates.size() == 1);

    fixture.clock->advance(0.5);
    a->acknowledgeCritical(0);
    REQUIRE(listenerA->delivered == vector<uint64_t>({0}));
    SynchronizerStats stats = a->getStats();
    REQUIRE(stats.reliability.reliability == Approx(1.0));
    REQUIRE(stats.reliability.avgLatencyMs == Approx(0.5));
    REQUIRE(stats.resolver.pendingCount == 0);

    fixture.timers->advance(50);
    REQUIRE(listenerA->sent.size() == 3);
  }

  SECTION("Never acknowledged") {
    fixture.timers->advance(20);
    REQUIRE(listenerA->sent.size() == 18);
    SynchronizerStats stats = a->getStats();
    REQUIRE(stats.reliability.packetsAbandoned == 1);
    REQUIRE(stats.reliability.reliability == 0.0);
    REQUIRE(stats.resolver.pendingCount == 0);
  }
}

TEST_CASE("Synchronizer queues while the window is closed",
          "[Synchronizer]") {
  SynchronizerFixture fixture;
  SynchronizerConfig config;
  config.congestion.mss = 100;
  config.congestion.initialWindowPackets = 1;
  config.congestion.minWindowPackets = 1;
  shared_ptr<RecordingListener> listener;
  shared_ptr<Synchronizer> a = fixture.create("A", &listener, config);

  string typed = "abcdefghij";
  for (char c : typed) {
    a->sendInput(string(1, c));
  }
  REQUIRE(a->getState() == typed);
  size_t queued = a->getStats().queuedPackets;
  REQUIRE(queued > 0);
  REQUIRE(listener->sent.size() + queued == typed.length());

  // Acknowledgments reopen the window and flush the queue in order
  size_t acked = 0;
  while (acked < listener->sent.size()) {
    SyncUpdate update = decodeUpdate(listener->sent[acked]);
    REQUIRE(update.sequence() == acked);
    REQUIRE(update.operation().text() == typed.substr(acked, 1));
    fixture.clock->advance(1);
    a->acknowledge(update.sequence(), 5);
    acked++;
  }
  REQUIRE(acked == typed.length());
  REQUIRE(a->getStats().queuedPackets == 0);
  REQUIRE(a->getStats().droppedPackets == 0);
}

TEST_CASE("Synchronizer output and delta sync", "[Synchronizer]") {
  SynchronizerFixture fixture;
  shared_ptr<RecordingListener> listenerA;
  shared_ptr<RecordingListener> listenerB;
  shared_ptr<Synchronizer> a = fixture.create("A", &listenerA);
  shared_ptr<Synchronizer> b = fixture.create("B", &listenerB);

  SECTION("Output is appended and not sent") {
    a->sendInput("ls");
    a->processOutput("\r\nREADME\r\n");
    REQUIRE(a->getState() == "ls\r\nREADME\r\n");
    REQUIRE(a->getCursor() == 12);
    REQUIRE(listenerA->outputs.size() == 1);
    REQUIRE(listenerA->outputs[0].second == 2);
    REQUIRE(listenerA->sent.size() == 1);
    REQUIRE(a->getStats().delta.leafCount == 1);
    REQUIRE(a->getStats().resolver.bufferLength == 12);
  }

  SECTION("Identical output gives identical roots") {
    a->processOutput("$ ls\r\n");
    a->processOutput("README.md\r\n");
    b->processOutput("$ ls\r\n");
    b->processOutput("README.md\r\n");
    REQUIRE(a->getMerkleRoot() == b->getMerkleRoot());
    REQUIRE(a->sync(b->getMerkleRoot(), b->getNodeTable()).empty());
  }

  SECTION("Missing output is transferred") {
    a->processOutput("one\r\n");
    b->processOutput("one\r\n");
    a->processOutput("two\r\n");
    fixture.clock->advance(5);
    a->processOutput("three\r\n");

    vector<string> missing = b->sync(a->getMerkleRoot(), a->getNodeTable());
    REQUIRE(missing.size() == 2);
    for (const auto& leaf : missing) {
      REQUIRE(b->applySyncedLeaf(leaf));
    }
    REQUIRE(b->getState() == a->getState());
    REQUIRE(b->getMerkleRoot() == a->getMerkleRoot());
    REQUIRE(b->sync(a->getMerkleRoot(), a->getNodeTable()).empty());
  }

  SECTION("Only output leaves can be applied") {
    REQUIRE_FALSE(b->applySyncedLeaf(
        WireCodec::encode(MessageType::INPUT, 1, "x")));
    REQUIRE_FALSE(b->applySyncedLeaf("junk"));
    REQUIRE(b->getState() == "");
  }
}

TEST_CASE("Synchronizer drops malformed packets", "[Synchronizer]") {
  SynchronizerFixture fixture;
  shared_ptr<RecordingListener> listener;
  shared_ptr<Synchronizer> b = fixture.create("B", &listener);

  b->onRemoteUpdate("garbage", 5);
  b->onRemoteUpdate(WireCodec::encode(MessageType::INPUT, 1, "\xff\xff\xff"),
                    5);
  b->onRemoteUpdate(WireCodec::encode(MessageType::OUTPUT, 1, "text"), 5);
  b->onRemoteUpdate(WireCodec::encode(MessageType::INPUT, 1, ""), 5);

  REQUIRE(b->getState() == "");
  REQUIRE(listener->updates.empty());
  REQUIRE(listener->acknowledgments.empty());
  // The round trip still reaches the congestion model
  REQUIRE(b->getStats().congestion.minRoundTripMs == Approx(5));
}

TEST_CASE("Synchronizer notifies listeners in order", "[Synchronizer]") {
  SynchronizerFixture fixture;
  shared_ptr<RecordingListener> listener;
  shared_ptr<Synchronizer> a = fixture.create("A", &listener);
  vector<int> order;
  a->addListener(
      shared_ptr<SynchronizerListener>(new OrderListener(1, &order)));
  a->addListener(
      shared_ptr<SynchronizerListener>(new OrderListener(2, &order)));

  a->processOutput("x");
  a->processOutput("y");
  REQUIRE(order == vector<int>({1, 2, 1, 2}));
}

TEST_CASE("Synchronizer input after shared output", "[Synchronizer]") {
  SynchronizerFixture fixture;
  shared_ptr<RecordingListener> listenerA;
  shared_ptr<RecordingListener> listenerB;
  shared_ptr<Synchronizer> a = fixture.create("A", &listenerA);
  shared_ptr<Synchronizer> b = fixture.create("B", &listenerB);

  a->processOutput("$ ");
  b->processOutput("$ ");
  REQUIRE(a->getMerkleRoot() == b->getMerkleRoot());

  a->sendInput("x");
  deliverAll(listenerA->sent, b);
  REQUIRE(a->getState() == "$ x");
  REQUIRE(b->getState() == "$ x");
  REQUIRE(b->getStats().buffer.parked == 0);

  b->sendInput("y");
  deliverAll(listenerB->sent, a);
  REQUIRE(a->getState() == "$ xy");
  REQUIRE(b->getState() == "$ xy");
  REQUIRE(a->getStats().buffer.parked == 0);
}

TEST_CASE("Synchronizer input after synced output", "[Synchronizer]") {
  SynchronizerFixture fixture;
  shared_ptr<RecordingListener> listenerP;
  shared_ptr<RecordingListener> listenerR;
  shared_ptr<Synchronizer> primary = fixture.create("P", &listenerP);
  shared_ptr<Synchronizer> replica = fixture.create("R", &listenerR);

  primary->processOutput("$ ");
  vector<string> missing =
      replica->sync(primary->getMerkleRoot(), primary->getNodeTable());
  REQUIRE(missing.size() == 1);
  REQUIRE(replica->applySyncedLeaf(missing[0]));

  replica->sendInput("ls");
  deliverAll(listenerR->sent, primary);
  REQUIRE(primary->getState() == "$ ls");
  REQUIRE(replica->getState() == "$ ls");
  REQUIRE(primary->getStats().buffer.parked == 0);

  // The next output follows the typed command on both ends
  fixture.clock->advance(3);
  primary->processOutput("\r\nREADME\r\n");
  REQUIRE(listenerP->outputs.back().second == 4);
  missing = replica->sync(primary->getMerkleRoot(), primary->getNodeTable());
  REQUIRE(missing.size() == 1);
  REQUIRE(replica->applySyncedLeaf(missing[0]));

  REQUIRE(primary->getState() == "$ ls\r\nREADME\r\n");
  REQUIRE(replica->getState() == primary->getState());
  REQUIRE(replica->getMerkleRoot() == primary->getMerkleRoot());
  REQUIRE(replica->getStats().resolver.bufferLength == 14);
}

TEST_CASE("Synchronizer acknowledgments retire their own operation",
          "[Synchronizer]") {
  SynchronizerFixture fixture;
  shared_ptr<RecordingListener> listener;
  shared_ptr<Synchronizer> a = fixture.create("A", &listener);

  a->sendInput("ab");
  a->sendInput("\r");
  a->sendInput("cd");
  REQUIRE(a->getStats().resolver.pendingCount == 3);

  a->acknowledgeCritical(0);
  REQUIRE(a->getStats().resolver.pendingCount == 2);
  a->acknowledge(1, 10);
  REQUIRE(a->getStats().resolver.pendingCount == 1);

  // A repeated acknowledgment does not take another operation with it
  a->acknowledge(1, 10);
  a->acknowledgeCritical(0);
  REQUIRE(a->getStats().resolver.pendingCount == 1);
  REQUIRE(a->getStats().resolver.serverRevision == 2);

  a->acknowledge(0, 10);
  REQUIRE(a->getStats().resolver.pendingCount == 0);
  REQUIRE(a->getStats().congestion.inFlight == 0);
}

TEST_CASE("Synchronizer resends lost packets", "[Synchronizer]") {
  SynchronizerFixture fixture;
  SynchronizerConfig config;
  config.ackTimeoutMs = 100;
  config.reliability.maxRetransmits = 2;
  shared_ptr<RecordingListener> listenerA;
  shared_ptr<RecordingListener> listenerB;
  shared_ptr<Synchronizer> a = fixture.create("A", &listenerA, config);
  shared_ptr<Synchronizer> b = fixture.create("B", &listenerB);
  double initialWindow = a->getStats().congestion.window;

  a->sendInput("x");
  REQUIRE(listenerA->sent.size() == 1);
  fixture.timers->advance(100);
  REQUIRE(listenerA->sent.size() == 2);
  REQUIRE(listenerA->sent[1] == listenerA->sent[0]);

  SynchronizerStats stats = a->getStats();
  REQUIRE(stats.lostPackets == 1);
  REQUIRE(stats.congestion.window < initialWindow);
  REQUIRE(stats.congestion.inFlight > 0);
  REQUIRE(stats.resolver.pendingCount == 1);

  SECTION("Acknowledged after a resend") {
    deliverAll(listenerA->sent, b);
    REQUIRE(b->getState() == "x");
    REQUIRE(b->getStats().duplicateUpdates == 1);

    a->acknowledge(0, 10);
    REQUIRE(a->getStats().resolver.pendingCount == 0);
    REQUIRE(a->getStats().congestion.inFlight == 0);
    fixture.timers->advance(1000);
    REQUIRE(listenerA->sent.size() == 2);
  }

  SECTION("Abandoned after every retransmission") {
    fixture.timers->advance(100);
    REQUIRE(listenerA->sent.size() == 3);
    fixture.timers->advance(100);
    REQUIRE(listenerA->sent.size() == 3);
    REQUIRE(fixture.timers->empty());

    stats = a->getStats();
    REQUIRE(stats.lostPackets == 3);
    REQUIRE(stats.abandonedPackets == 1);
    REQUIRE(stats.congestion.inFlight == 0);
    REQUIRE(stats.resolver.pendingCount == 0);
    REQUIRE(stats.queuedPackets == 0);

    // A late acknowledgment is ignored
    a->acknowledge(0, 10);
    REQUIRE(a->getStats().resolver.serverRevision == 0);
  }
}

TEST_CASE("Synchronizer recovers from sustained loss", "[Synchronizer]") {
  SynchronizerFixture fixture;
  shared_ptr<RecordingListener> listener;
  shared_ptr<Synchronizer> a = fixture.create("A", &listener);

  // Every other packet is lost
  for (uint64_t i = 0; i < 100; i++) {
    a->sendInput("x");
    fixture.clock->advance(1);
    if (i % 2 == 0) {
      a->acknowledge(i, 1);
    }
  }
  SynchronizerStats stats = a->getStats();
  REQUIRE(stats.congestion.phase == CongestionPhase::DRAIN);
  REQUIRE(stats.congestion.inFlight > 0);
  REQUIRE(stats.resolver.pendingCount == 50);

  fixture.timers->advance(10000);
  stats = a->getStats();
  REQUIRE(stats.abandonedPackets == 50);
  REQUIRE(stats.lostPackets == 300);
  REQUIRE(stats.congestion.inFlight == 0);
  REQUIRE(stats.resolver.pendingCount == 0);
  REQUIRE(stats.queuedPackets == 0);

  // With nothing left in flight, the next acknowledgment ends the drain
  a->sendInput("z");
  SyncUpdate update = decodeUpdate(listener->sent.back());
  REQUIRE(update.sequence() == 100);
  fixture.clock->advance(1);
  a->acknowledge(update.sequence(), 1);
  REQUIRE(a->getStats().congestion.phase ==
          CongestionPhase::PROBE_BANDWIDTH);
}
