#include "Synchronizer.hpp"

namespace ssp {
namespace {
/**
 * @brief Wraps a TimerHandler so that callbacks fire under the session lock.
 */
class LockingTimerHandler : public TimerHandler {
 public:
  LockingTimerHandler(shared_ptr<TimerHandler> _inner,
                      shared_ptr<recursive_mutex> _stateMutex)
      : inner(_inner), stateMutex(_stateMutex) {}
  virtual ~LockingTimerHandler() {}

  virtual void schedule(double delayMs, std::function<void()> callback) {
    shared_ptr<recursive_mutex> m = stateMutex;
    inner->schedule(delayMs, [m, callback]() {
      lock_guard<recursive_mutex> guard(*m);
      callback();
    });
  }

 protected:
  shared_ptr<TimerHandler> inner;
  shared_ptr<recursive_mutex> stateMutex;
};

string chooseSiteId(const SynchronizerConfig& config,
                    shared_ptr<SiteIdSource> siteIdSource) {
  if (!config.siteId.empty()) {
    return config.siteId;
  }
  if (siteIdSource.get() == NULL) {
    STFATAL << "No site id configured and no SiteIdSource supplied";
  }
  return siteIdSource->newSiteId();
}

inline bool isBackspace(char c) { return c == 0x7f || c == 0x08; }

inline string normalAckKey(uint64_t sequence) {
  return "n:" + to_string(sequence);
}

inline string criticalAckKey(uint64_t sequence) {
  return "c:" + to_string(sequence);
}
}  // namespace

Synchronizer::Synchronizer(shared_ptr<Clock> _clock,
                           shared_ptr<TimerHandler> _timerHandler,
                           shared_ptr<SiteIdSource> siteIdSource,
                           const SynchronizerConfig& _config)
    : clock(_clock),
      stateMutex(new recursive_mutex()),
      timerHandler(_timerHandler),
      lockingTimers(new LockingTimerHandler(_timerHandler, stateMutex)),
      siteId(chooseSiteId(_config, siteIdSource)),
      config(_config),
      congestion(_clock, _config.congestion),
      resolver(_clock, siteId),
      buffer(siteId),
      nextNormalSequence(0),
      droppedPackets(0),
      duplicateUpdates(0),
      lostPackets(0),
      abandonedPackets(0),
      cursor(0),
      alive(new bool(true)) {
  congestion.setTerminalProfile();
  reliability.reset(
      new ReliabilityLayer(clock, lockingTimers, this, config.reliability));
  VLOG(1) << "Synchronizer " << siteId << " ready";
}

Synchronizer::~Synchronizer() {
  lock_guard<recursive_mutex> guard(*stateMutex);
  alive.reset();
  reliability.reset();
}

void Synchronizer::addListener(shared_ptr<SynchronizerListener> listener) {
  lock_guard<recursive_mutex> guard(*stateMutex);
  listeners.push_back(listener);
}

void Synchronizer::sendInput(const string& text) {
  lock_guard<recursive_mutex> guard(*stateMutex);
  if (text.empty()) {
    return;
  }
  double now = clock->now();
  bool critical = isCritical(text);
  uint64_t predictedAt = cursor;

  size_t i = 0;
  while (i < text.length()) {
    if (isBackspace(text[i])) {
      i++;
      CharacterRecord removed;
      if (cursor == 0 || !buffer.remove(cursor - 1, &removed)) {
        VLOG(2) << "Nothing to erase before the cursor";
        continue;
      }
      cursor--;
      SyncUpdate update;
      *update.mutable_operation() =
          resolver.applyLocalDelete(cursor, 1, nextAckKey(critical));
      *update.add_records() = removed;
      transmit(&update, critical);
      continue;
    }

    size_t end = i;
    while (end < text.length() && !isBackspace(text[end])) {
      end++;
    }
    string run = text.substr(i, end - i);
    SyncUpdate update;
    *update.mutable_operation() =
        resolver.applyLocalInsert(cursor, run, nextAckKey(critical));
    for (char c : run) {
      *update.add_records() = buffer.insert(cursor, string(1, c));
      cursor++;
    }
    transmit(&update, critical);
    i = end;
  }

  auto current = listeners;
  for (auto& listener : current) {
    listener->onPredict(text, predictedAt, now);
  }
}

void Synchronizer::processOutput(const string& text) {
  lock_guard<recursive_mutex> guard(*stateMutex);
  if (text.empty()) {
    return;
  }
  double now = clock->now();

  uint64_t position = buffer.appendOutput(text);
  resolver.applyOutput(position, text);
  cursor = buffer.visibleSize();

  delta.addLeaf(WireCodec::encode(MessageType::OUTPUT, uint64_t(now), text));

  auto current = listeners;
  for (auto& listener : current) {
    listener->onOutput(text, position, now);
  }
}

void Synchronizer::onRemoteUpdate(const string& packet,
                                  double observedRoundTripMs) {
  lock_guard<recursive_mutex> guard(*stateMutex);
  WireMessageView view;
  if (!WireCodec::decode(packet, &view)) {
    return;
  }
  congestion.onRoundTripSample(observedRoundTripMs);

  if (view.type != MessageType::INPUT) {
    VLOG(2) << "Ignoring inbound " << WireCodec::messageTypeToString(view.type)
            << " message";
    return;
  }

  SyncUpdate update;
  if (!update.ParseFromArray(view.payloadData, int(view.payloadLength)) ||
      !update.has_operation()) {
    return;
  }

  auto current = listeners;
  for (auto& listener : current) {
    listener->onAcknowledge(update.sequence(), update.critical());
  }

  // Critical packets arrive once per path, and lost normal packets are sent
  // again
  string stream =
      update.operation().origin() + (update.critical() ? ":c" : ":n");
  if (!receiveWindows[stream].accept(update.sequence())) {
    duplicateUpdates++;
    return;
  }

  resolver.onRemoteOperation(update.operation());

  bool followEnd = cursor >= buffer.visibleSize();
  for (const auto& record : update.records()) {
    buffer.merge(record);
  }
  uint64_t visible = buffer.visibleSize();
  cursor = followEnd ? visible : std::min(cursor, visible);

  string content = buffer.getContent();
  current = listeners;
  for (auto& listener : current) {
    listener->onUpdate(content, view.timestamp);
  }
}

vector<string> Synchronizer::sync(const string& remoteRoot,
                                  const NodeTable& remoteNodes) {
  lock_guard<recursive_mutex> guard(*stateMutex);
  string localRoot = delta.buildTree();
  vector<string> diff = delta.findDiff(localRoot, remoteRoot, remoteNodes);

  vector<string> missing;
  for (const auto& hash : diff) {
    auto it = remoteNodes.nodes().find(hash);
    if (it != remoteNodes.nodes().end() && it->second.has_leaf_payload()) {
      missing.push_back(it->second.leaf_payload());
    }
  }
  VLOG(1) << "Delta sync found " << missing.size() << " missing leaves";
  return missing;
}

bool Synchronizer::applySyncedLeaf(const string& leafPayload) {
  lock_guard<recursive_mutex> guard(*stateMutex);
  WireMessageView view;
  if (!WireCodec::decode(leafPayload, &view) ||
      view.type != MessageType::OUTPUT) {
    return false;
  }

  string text = view.payload();
  uint64_t position = buffer.appendOutput(text);
  resolver.applyOutput(position, text);
  cursor = buffer.visibleSize();
  delta.addLeaf(leafPayload);

  auto current = listeners;
  for (auto& listener : current) {
    listener->onOutput(text, position, double(view.timestamp));
  }
  return true;
}

void Synchronizer::acknowledge(uint64_t sequence, double roundTripMs) {
  lock_guard<recursive_mutex> guard(*stateMutex);
  auto it = normalPackets.find(sequence);
  if (it == normalPackets.end()) {
    VLOG(2) << "Ack for unknown packet " << sequence;
    return;
  }
  bool inFlight = it->second.inFlight;
  double size = double(it->second.data.length());
  normalPackets.erase(it);

  // A packet queued again after a timeout may still be acknowledged
  if (inFlight) {
    congestion.onAck(sequence, size, roundTripMs);
  }
  resolver.onServerAck(normalAckKey(sequence));
  flushSendQueue();
}

void Synchronizer::acknowledgeCritical(uint64_t sequence) {
  lock_guard<recursive_mutex> guard(*stateMutex);
  if (!reliability->isUnacked(sequence)) {
    VLOG(2) << "Ack for unknown critical packet " << sequence;
    return;
  }
  reliability->onAck(sequence);
  resolver.onServerAck(criticalAckKey(sequence));
}

string Synchronizer::getMerkleRoot() {
  lock_guard<recursive_mutex> guard(*stateMutex);
  return delta.buildTree();
}

NodeTable Synchronizer::getNodeTable() {
  lock_guard<recursive_mutex> guard(*stateMutex);
  delta.buildTree();
  return delta.getAllNodes();
}

string Synchronizer::getState() {
  lock_guard<recursive_mutex> guard(*stateMutex);
  return buffer.getContent();
}

uint64_t Synchronizer::getCursor() {
  lock_guard<recursive_mutex> guard(*stateMutex);
  return cursor;
}

SynchronizerStats Synchronizer::getStats() {
  lock_guard<recursive_mutex> guard(*stateMutex);
  SynchronizerStats stats;
  stats.siteId = siteId;
  stats.congestion = congestion.getStats();
  stats.resolver = resolver.getStats();
  stats.buffer = buffer.getStats();
  stats.reliability = reliability->getStats();
  stats.delta = delta.getStats();
  stats.queuedPackets = sendQueue.count();
  stats.droppedPackets = droppedPackets;
  stats.duplicateUpdates = duplicateUpdates;
  stats.lostPackets = lostPackets;
  stats.abandonedPackets = abandonedPackets;
  return stats;
}

void Synchronizer::onPathSend(uint64_t sequence, const string& payload,
                              int path) {
  VLOG(3) << "Critical packet " << sequence << " on path " << path;
  auto current = listeners;
  for (auto& listener : current) {
    listener->onSend(payload);
  }
}

void Synchronizer::onDelivered(uint64_t sequence, double latencyMs) {
  auto current = listeners;
  for (auto& listener : current) {
    listener->onDelivered(sequence, latencyMs);
  }
}

void Synchronizer::onAbandoned(uint64_t sequence) {
  resolver.dropPending(criticalAckKey(sequence));
}

bool Synchronizer::isCritical(const string& text) const {
  // Control characters, including CR and LF
  return !text.empty() && (unsigned char)(text[0]) < 32;
}

string Synchronizer::nextAckKey(bool critical) const {
  if (critical) {
    return criticalAckKey(reliability->peekNextSequence());
  }
  return normalAckKey(nextNormalSequence);
}

void Synchronizer::transmit(SyncUpdate* update, bool critical) {
  uint64_t timestamp = uint64_t(clock->now());
  update->set_critical(critical);

  if (critical) {
    uint64_t sequence = reliability->peekNextSequence();
    update->set_sequence(sequence);
    string packet = WireCodec::encode(MessageType::INPUT, timestamp,
                                      protoToString(*update));
    uint64_t assigned = reliability->sendCritical(packet);
    if (assigned != sequence) {
      STFATAL << "Reliability layer assigned " << assigned << ", expected "
              << sequence;
    }
    return;
  }

  uint64_t sequence = nextNormalSequence++;
  update->set_sequence(sequence);
  string packet = WireCodec::encode(MessageType::INPUT, timestamp,
                                    protoToString(*update));
  NormalPacket& entry = normalPackets[sequence];
  entry.data = packet;
  entry.transmissions = 0;
  entry.inFlight = false;

  if (!sendQueue.hasPendingData() && congestion.canSend()) {
    sendNormal(sequence);
  } else if (!sendQueue.enqueue(sequence, packet)) {
    droppedPackets++;
    LOG(WARNING) << "Send queue full, dropping packet " << sequence;
    normalPackets.erase(sequence);
    resolver.dropPending(normalAckKey(sequence));
  } else {
    VLOG(2) << "Window closed, queued packet " << sequence;
  }
}

void Synchronizer::sendNormal(uint64_t sequence) {
  auto it = normalPackets.find(sequence);
  if (it == normalPackets.end()) {
    return;
  }
  it->second.inFlight = true;
  it->second.transmissions++;
  int transmission = it->second.transmissions;
  // Listeners may acknowledge synchronously and erase the entry
  string packet = it->second.data;

  congestion.onPacketSent(sequence, double(packet.length()));
  scheduleAckTimeout(sequence, transmission);

  auto current = listeners;
  for (auto& listener : current) {
    listener->onSend(packet);
  }
}

void Synchronizer::flushSendQueue() {
  while (sendQueue.hasPendingData() && congestion.canSend()) {
    uint64_t sequence = sendQueue.peek()->sequence;
    sendQueue.pop();
    if (normalPackets.find(sequence) == normalPackets.end()) {
      // Acknowledged while it waited
      continue;
    }
    sendNormal(sequence);
  }
}

void Synchronizer::scheduleAckTimeout(uint64_t sequence, int transmission) {
  weak_ptr<bool> weakAlive(alive);
  lockingTimers->schedule(
      config.ackTimeoutMs, [this, weakAlive, sequence, transmission]() {
        if (weakAlive.expired()) {
          return;
        }
        auto it = normalPackets.find(sequence);
        if (it == normalPackets.end() || !it->second.inFlight ||
            it->second.transmissions != transmission) {
          return;
        }
        onNormalLoss(sequence);
      });
}

void Synchronizer::onNormalLoss(uint64_t sequence) {
  NormalPacket& entry = normalPackets[sequence];
  entry.inFlight = false;
  lostPackets++;
  congestion.onLoss(sequence, double(entry.data.length()));

  if (entry.transmissions > config.reliability.maxRetransmits) {
    abandonNormal(sequence);
    return;
  }
  VLOG(1) << "Packet " << sequence << " timed out, sending again";
  if (!sendQueue.enqueue(sequence, entry.data)) {
    droppedPackets++;
    LOG(WARNING) << "Send queue full, dropping packet " << sequence;
    abandonNormal(sequence);
    return;
  }
  flushSendQueue();
}

void Synchronizer::abandonNormal(uint64_t sequence) {
  LOG(WARNING) << "Abandoning packet " << sequence << " after "
               << normalPackets[sequence].transmissions << " transmissions";
  normalPackets.erase(sequence);
  abandonedPackets++;
  resolver.dropPending(normalAckKey(sequence));
}
}  // namespace ssp
