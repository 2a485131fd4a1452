#ifndef __SSP_SIMULATED_LINK__
#define __SSP_SIMULATED_LINK__

#include "Headers.hpp"
#include "Synchronizer.hpp"
#include "TimerHandler.hpp"

namespace ssp {
/**
 * @brief One direction of a lossy, delayed network path.
 *
 * Each carried item is either dropped (with probability lossPercent / 100,
 * drawn from rand()) or delivered through the TimerHandler after the link
 * latency.
 */
class SimulatedLink {
 public:
  SimulatedLink(shared_ptr<TimerHandler> _timerHandler, double _latencyMs,
                int _lossPercent);

  void carry(std::function<void()> deliver);

  double getLatency() const { return latencyMs; }
  int64_t getCarried() const { return carried; }
  int64_t getLost() const { return lost; }

 protected:
  shared_ptr<TimerHandler> timerHandler;
  double latencyMs;
  int lossPercent;
  int64_t carried;
  int64_t lost;
};

/**
 * @brief Connects a Synchronizer's outbound events to its peer through a
 * SimulatedLink.
 *
 * Packets the owner sends reach the peer's onRemoteUpdate. Acknowledgments
 * for packets the owner received travel back to the peer that sent them.
 */
class LinkedEndpoint : public SynchronizerListener {
 public:
  explicit LinkedEndpoint(shared_ptr<SimulatedLink> _outbound)
      : outbound(_outbound) {}
  virtual ~LinkedEndpoint() {}

  void connect(shared_ptr<Synchronizer> _peer) { peer = _peer; }

  virtual void onSend(const string& packet);
  virtual void onAcknowledge(uint64_t sequence, bool critical);
  virtual void onDelivered(uint64_t sequence, double latencyMs);

 protected:
  shared_ptr<SimulatedLink> outbound;
  weak_ptr<Synchronizer> peer;
};
}  // namespace ssp

#endif  // __SSP_SIMULATED_LINK__
