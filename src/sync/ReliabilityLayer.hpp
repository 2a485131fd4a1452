#ifndef __SSP_RELIABILITY_LAYER__
#define __SSP_RELIABILITY_LAYER__

#include "Clock.hpp"
#include "Headers.hpp"
#include "TimerHandler.hpp"

namespace ssp {
enum class PacketPriority { CRITICAL = 0, NORMAL = 1 };

/** @brief A packet waiting in the unacknowledged table. */
struct ReliablePacket {
  uint64_t sequence;
  string payload;
  /** @brief Time of the first transmission. */
  double sentAt;
  PacketPriority priority;
  uint8_t retransmitCount;
  set<uint8_t> pathsUsed;
};

struct ReliabilityConfig {
  /** @brief Number of paths every critical packet is copied onto. */
  int redundancy = 3;
  double targetLatencyMs = 1;
  int maxRetransmits = 5;
  size_t maxLatencySamples = 100;
};

struct ReliabilityStats {
  int64_t packetsSent;
  int64_t packetsAcked;
  int64_t packetsRetransmitted;
  int64_t packetsAbandoned;
  double avgLatencyMs;
  /** @brief acked / sent, 0 until something has been sent. */
  double reliability;
  size_t unackedCount;
};

/**
 * @brief Receives the output of a ReliabilityLayer.
 */
class ReliabilityObserver {
 public:
  virtual ~ReliabilityObserver() {}

  /** @brief One copy of a packet must go out on `path`. */
  virtual void onPathSend(uint64_t sequence, const string& payload,
                          int path) = 0;
  /** @brief A packet was acknowledged `latencyMs` after its first send. */
  virtual void onDelivered(uint64_t sequence, double latencyMs) = 0;
  /** @brief A packet ran out of retransmissions and was dropped. */
  virtual void onAbandoned(uint64_t sequence) {}
};

/**
 * @brief Delivers critical packets over redundant paths with a bounded
 * retransmission budget.
 *
 * Every packet is copied onto all paths at once. A retransmission check runs
 * every 2 x target latency; a packet still unacknowledged after the whole
 * budget is dropped and only shows up in the reliability ratio.
 */
class ReliabilityLayer {
 public:
  ReliabilityLayer(shared_ptr<Clock> _clock,
                   shared_ptr<TimerHandler> _timerHandler,
                   ReliabilityObserver* _observer,
                   const ReliabilityConfig& _config = ReliabilityConfig());
  ~ReliabilityLayer();

  /**
   * @brief Sends `payload` on every path and starts its retransmission
   * schedule.
   * @return The sequence number assigned to the packet.
   */
  uint64_t sendCritical(const string& payload);

  /** @brief Sequence number the next sendCritical call will assign. */
  uint64_t peekNextSequence() const { return sequence; }

  /** @brief Handles an acknowledgment. Unknown sequence numbers are ignored. */
  void onAck(uint64_t seq);

  bool isUnacked(uint64_t seq) const {
    return unacked.find(seq) != unacked.end();
  }

  ReliabilityStats getStats() const;

 protected:
  void sendOnAllPaths(uint64_t seq);
  void scheduleCheck(uint64_t seq);
  void checkRetransmit(uint64_t seq);

  shared_ptr<Clock> clock;
  shared_ptr<TimerHandler> timerHandler;
  ReliabilityObserver* observer;
  ReliabilityConfig config;

  map<uint64_t, ReliablePacket> unacked;
  uint64_t sequence;

  int64_t packetsSent;
  int64_t packetsAcked;
  int64_t packetsRetransmitted;
  int64_t packetsAbandoned;
  deque<double> latencySamples;
  double avgLatencyMs;

  /** @brief Expires when this layer is destroyed so late timers do nothing. */
  shared_ptr<bool> alive;
};
}  // namespace ssp

#endif  // __SSP_RELIABILITY_LAYER__
