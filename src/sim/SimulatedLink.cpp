#include "SimulatedLink.hpp"

namespace ssp {
SimulatedLink::SimulatedLink(shared_ptr<TimerHandler> _timerHandler,
                             double _latencyMs, int _lossPercent)
    : timerHandler(_timerHandler),
      latencyMs(_latencyMs),
      lossPercent(_lossPercent),
      carried(0),
      lost(0) {}

void SimulatedLink::carry(std::function<void()> deliver) {
  if (lossPercent > 0 && rand() % 100 < lossPercent) {
    lost++;
    VLOG(2) << "Link dropped a packet";
    return;
  }
  carried++;
  timerHandler->schedule(latencyMs, deliver);
}

void LinkedEndpoint::onSend(const string& packet) {
  weak_ptr<Synchronizer> weakPeer = peer;
  double roundTripMs = outbound->getLatency() * 2;
  outbound->carry([weakPeer, packet, roundTripMs]() {
    shared_ptr<Synchronizer> target = weakPeer.lock();
    if (target) {
      target->onRemoteUpdate(packet, roundTripMs);
    }
  });
}

void LinkedEndpoint::onAcknowledge(uint64_t sequence, bool critical) {
  weak_ptr<Synchronizer> weakPeer = peer;
  double roundTripMs = outbound->getLatency() * 2;
  outbound->carry([weakPeer, sequence, critical, roundTripMs]() {
    shared_ptr<Synchronizer> target = weakPeer.lock();
    if (!target) {
      return;
    }
    if (critical) {
      target->acknowledgeCritical(sequence);
    } else {
      target->acknowledge(sequence, roundTripMs);
    }
  });
}

void LinkedEndpoint::onDelivered(uint64_t sequence, double latencyMs) {
  VLOG(1) << "Critical packet " << sequence << " delivered in " << latencyMs
          << " ms";
}
}  // namespace ssp
