#ifndef __SSP_SYNCHRONIZER__
#define __SSP_SYNCHRONIZER__

#include "Clock.hpp"
#include "ConflictResolver.hpp"
#include "CongestionController.hpp"
#include "DeltaSynchronizer.hpp"
#include "Headers.hpp"
#include "ReceiveWindow.hpp"
#include "ReliabilityLayer.hpp"
#include "ReplicatedBuffer.hpp"
#include "SendQueue.hpp"
#include "SiteIdSource.hpp"
#include "SynchronizerConfig.hpp"
#include "TimerHandler.hpp"
#include "WireCodec.hpp"

namespace ssp {
/**
 * @brief Receives the events a Synchronizer emits. Every callback defaults to
 * a no-op so listeners only override what they consume.
 *
 * Callbacks run while the Synchronizer holds its lock; a listener may call
 * back into the same Synchronizer.
 */
class SynchronizerListener {
 public:
  virtual ~SynchronizerListener() {}

  /** @brief An encoded packet must be handed to the transport. */
  virtual void onSend(const string& packet) {}
  /** @brief Local input was applied optimistically. */
  virtual void onPredict(const string& text, uint64_t position,
                         double timestamp) {}
  /** @brief Process output was appended to the buffer. */
  virtual void onOutput(const string& content, uint64_t position,
                        double timestamp) {}
  /** @brief A remote update was merged; `content` is the whole buffer. */
  virtual void onUpdate(const string& content, uint64_t timestamp) {}
  /** @brief A critical packet was acknowledged. */
  virtual void onDelivered(uint64_t sequence, double latencyMs) {}
  /** @brief A remote update arrived and should be acknowledged. */
  virtual void onAcknowledge(uint64_t sequence, bool critical) {}
};

struct SynchronizerStats {
  string siteId;
  CongestionStats congestion;
  ConflictResolverStats resolver;
  ReplicatedBufferStats buffer;
  ReliabilityStats reliability;
  DeltaSyncStats delta;
  size_t queuedPackets;
  int64_t droppedPackets;
  int64_t duplicateUpdates;
  /** @brief Normal-path packets whose acknowledgment timed out. */
  int64_t lostPackets;
  /** @brief Normal-path packets given up on after every retransmission. */
  int64_t abandonedPackets;
};

/**
 * @brief One end of a synchronized terminal session.
 *
 * Owns every protocol component and drives them from four entry points:
 * local input, process output, inbound packets and delta sync requests.
 * All entry points, and the retransmission timers, are serialized on one
 * recursive mutex.
 *
 * Normal-path packets that stay unacknowledged for `ackTimeoutMs` count as
 * lost: the congestion controller is told, and the packet is queued again
 * until it runs out of retransmissions.
 */
class Synchronizer : public ReliabilityObserver {
 public:
  Synchronizer(shared_ptr<Clock> _clock, shared_ptr<TimerHandler> _timerHandler,
               shared_ptr<SiteIdSource> siteIdSource,
               const SynchronizerConfig& _config = SynchronizerConfig());
  virtual ~Synchronizer();

  void addListener(shared_ptr<SynchronizerListener> listener);

  /**
   * @brief Applies local keystrokes at the cursor, predicts them and sends
   * them. Backspace (0x7f or 0x08) deletes the character before the cursor.
   *
   * Input starting with a control character, or a lone line terminator, goes
   * through the reliability layer. Everything else is paced by the
   * congestion controller and queued while the window is closed.
   */
  void sendInput(const string& text);

  /**
   * @brief Appends process output to the buffer and to the delta sync
   * leaves. Output characters get ids derived from their offset in the
   * output stream, so replicas fed the same output agree on them.
   */
  void processOutput(const string& text);

  /**
   * @brief Handles one inbound packet. Malformed packets are dropped.
   */
  void onRemoteUpdate(const string& packet, double observedRoundTripMs);

  /**
   * @brief Returns the leaf payloads present in the remote tree but not in
   * ours. The result may be partial if `remoteNodes` is incomplete.
   */
  vector<string> sync(const string& remoteRoot, const NodeTable& remoteNodes);

  /**
   * @brief Appends a leaf obtained through sync() as if it were local
   * output, keeping its original encoding.
   * @return false if the payload is not an output message.
   */
  bool applySyncedLeaf(const string& leafPayload);

  /** @brief Acknowledges a normal-path packet. */
  void acknowledge(uint64_t sequence, double roundTripMs);

  /** @brief Acknowledges a critical packet. */
  void acknowledgeCritical(uint64_t sequence);

  string getMerkleRoot();
  NodeTable getNodeTable();

  /** @brief Visible content of the replicated buffer. */
  string getState();

  uint64_t getCursor();
  const string& getSiteId() const { return siteId; }

  SynchronizerStats getStats();

  // ReliabilityObserver
  virtual void onPathSend(uint64_t sequence, const string& payload, int path);
  virtual void onDelivered(uint64_t sequence, double latencyMs);
  virtual void onAbandoned(uint64_t sequence);

 protected:
  /** @brief A normal-path packet that has not been acknowledged yet. */
  struct NormalPacket {
    string data;
    int transmissions;
    bool inFlight;
  };

  bool isCritical(const string& text) const;
  /** @brief Key of the acknowledgment the next packet on a path expects. */
  string nextAckKey(bool critical) const;
  void transmit(SyncUpdate* update, bool critical);
  void sendNormal(uint64_t sequence);
  void flushSendQueue();
  void scheduleAckTimeout(uint64_t sequence, int transmission);
  void onNormalLoss(uint64_t sequence);
  void abandonNormal(uint64_t sequence);

  shared_ptr<Clock> clock;
  shared_ptr<recursive_mutex> stateMutex;
  shared_ptr<TimerHandler> timerHandler;
  /** @brief Fires callbacks with `stateMutex` held. */
  shared_ptr<TimerHandler> lockingTimers;
  string siteId;
  SynchronizerConfig config;

  CongestionController congestion;
  ConflictResolver resolver;
  ReplicatedBuffer buffer;
  DeltaSynchronizer delta;
  shared_ptr<ReliabilityLayer> reliability;

  SendQueue sendQueue;
  /** @brief Normal-path packets awaiting acknowledgment, sent or queued. */
  map<uint64_t, NormalPacket> normalPackets;
  uint64_t nextNormalSequence;
  /** @brief Sequence numbers already applied, per origin and path. */
  map<string, ReceiveWindow> receiveWindows;
  int64_t droppedPackets;
  int64_t duplicateUpdates;
  int64_t lostPackets;
  int64_t abandonedPackets;

  uint64_t cursor;
  vector<shared_ptr<SynchronizerListener>> listeners;

  /** @brief Expires when this Synchronizer is destroyed. */
  shared_ptr<bool> alive;
};
}  // namespace ssp

#endif  // __SSP_SYNCHRONIZER__
