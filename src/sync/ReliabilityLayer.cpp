#include "ReliabilityLayer.hpp"

namespace ssp {
ReliabilityLayer::ReliabilityLayer(shared_ptr<Clock> _clock,
                                   shared_ptr<TimerHandler> _timerHandler,
                                   ReliabilityObserver* _observer,
                                   const ReliabilityConfig& _config)
    : clock(_clock),
      timerHandler(_timerHandler),
      observer(_observer),
      config(_config),
      sequence(0),
      packetsSent(0),
      packetsAcked(0),
      packetsRetransmitted(0),
      packetsAbandoned(0),
      avgLatencyMs(0),
      alive(new bool(true)) {
  if (config.redundancy < 1) {
    STFATAL << "Invalid redundancy: " << config.redundancy;
  }
}

ReliabilityLayer::~ReliabilityLayer() { alive.reset(); }

uint64_t ReliabilityLayer::sendCritical(const string& payload) {
  uint64_t seq = sequence++;

  ReliablePacket& packet = unacked[seq];
  packet.sequence = seq;
  packet.payload = payload;
  packet.sentAt = clock->now();
  packet.priority = PacketPriority::CRITICAL;
  packet.retransmitCount = 0;
  packetsSent++;

  sendOnAllPaths(seq);
  scheduleCheck(seq);
  return seq;
}

void ReliabilityLayer::sendOnAllPaths(uint64_t seq) {
  // The observer may acknowledge synchronously, which erases the packet, so
  // work from a copy and look the packet up again on every path.
  string payload = unacked[seq].payload;
  for (int path = 0; path < config.redundancy; path++) {
    auto it = unacked.find(seq);
    if (it != unacked.end()) {
      it->second.pathsUsed.insert(uint8_t(path));
    }
    observer->onPathSend(seq, payload, path);
  }
}

void ReliabilityLayer::scheduleCheck(uint64_t seq) {
  weak_ptr<bool> weakAlive(alive);
  timerHandler->schedule(config.targetLatencyMs * 2, [this, weakAlive, seq]() {
    if (weakAlive.expired()) {
      return;
    }
    checkRetransmit(seq);
  });
}

void ReliabilityLayer::onAck(uint64_t seq) {
  auto it = unacked.find(seq);
  if (it == unacked.end()) {
    VLOG(2) << "Ack for unknown or abandoned packet " << seq;
    return;
  }

  double latency = clock->now() - it->second.sentAt;
  packetsAcked++;
  latencySamples.push_back(latency);
  while (latencySamples.size() > config.maxLatencySamples) {
    latencySamples.pop_front();
  }
  double total = 0;
  for (double sample : latencySamples) {
    total += sample;
  }
  avgLatencyMs = total / latencySamples.size();

  unacked.erase(it);
  observer->onDelivered(seq, latency);
}

void ReliabilityLayer::checkRetransmit(uint64_t seq) {
  auto it = unacked.find(seq);
  if (it == unacked.end()) {
    // Already acknowledged
    return;
  }

  ReliablePacket& packet = it->second;
  if (packet.retransmitCount < config.maxRetransmits) {
    packet.retransmitCount++;
    packetsRetransmitted++;
    VLOG(1) << "Retransmitting critical packet " << seq << " (attempt "
            << int(packet.retransmitCount) << ")";
    sendOnAllPaths(seq);
    scheduleCheck(seq);
    return;
  }

  LOG(WARNING) << "Abandoning critical packet " << seq << " after "
               << int(packet.retransmitCount) << " retransmissions";
  packetsAbandoned++;
  unacked.erase(it);
  observer->onAbandoned(seq);
}

ReliabilityStats ReliabilityLayer::getStats() const {
  ReliabilityStats stats;
  stats.packetsSent = packetsSent;
  stats.packetsAcked = packetsAcked;
  stats.packetsRetransmitted = packetsRetransmitted;
  stats.packetsAbandoned = packetsAbandoned;
  stats.avgLatencyMs = avgLatencyMs;
  stats.reliability =
      packetsSent == 0 ? 0.0 : double(packetsAcked) / double(packetsSent);
  stats.unackedCount = unacked.size();
  return stats;
}
}  // namespace ssp
