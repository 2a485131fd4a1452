#ifndef __SSP_CONGESTION_CONTROLLER__
#define __SSP_CONGESTION_CONTROLLER__

#include "Clock.hpp"
#include "Headers.hpp"

namespace ssp {
/**
 * @brief Phase of the bandwidth-probing state machine.
 */
enum class CongestionPhase {
  STARTUP = 0,
  DRAIN = 1,
  PROBE_BANDWIDTH = 2,
  PROBE_ROUND_TRIP = 3
};

string congestionPhaseToString(CongestionPhase phase);

/** @brief Tunables for CongestionController. */
struct CongestionConfig {
  /** @brief Bytes per segment. */
  double mss = 1460;
  double initialWindowPackets = 10;
  /** @brief Floor for every window computation, in segments. */
  double minWindowPackets = 4;
  /** @brief CUBIC multiplicative decrease factor. */
  double beta = 0.7;
  /** @brief CUBIC growth constant, segments per second cubed. */
  double cubicC = 0.4;
  double startupPacingGain = 2.89;
  double drainPacingGain = 0.35;
  double defaultCwndGain = 2.0;
  /** @brief Growth ratio the max bandwidth must reach to stay in STARTUP. */
  double startupGrowthThreshold = 1.25;
  /** @brief Rounds without enough growth before the pipe counts as full. */
  int startupFullBandwidthRounds = 3;
  int64_t probeRttIntervalRounds = 10000;
  double probeRttDurationMs = 200;
  /** @brief Delivery-rate samples kept for the max filter. */
  size_t maxRateSamples = 10;
  bool terminalProfile = true;
  double terminalCwndGain = 1.5;
  double terminalPacingGain = 1.25;
};

/**
 * @brief One acknowledgment's worth of delivery information.
 */
struct CongestionSample {
  double bytesDelivered;
  double roundTripMs;
  double timestamp;
  /** @brief Bytes per second observed for this sample. */
  double rate;
};

struct CongestionStats {
  CongestionPhase phase;
  double window;
  double inFlight;
  double minRoundTripMs;
  double maxBandwidth;
  double deliveryRate;
  double pacingRate;
  int64_t roundCount;
};

/**
 * @brief Paces outbound sends with a BBR/CUBIC hybrid tuned for small,
 * latency-sensitive terminal packets.
 *
 * BBR supplies the bandwidth model and the window while STARTUP and
 * PROBE_BANDWIDTH are active. CUBIC (floored by a TCP-friendly estimate)
 * supplies the window in DRAIN. PROBE_ROUND_TRIP pins the window to the
 * minimum so the path queue empties and a fresh minimum RTT can be observed.
 */
class CongestionController {
 public:
  CongestionController(shared_ptr<Clock> _clock,
                       const CongestionConfig& _config = CongestionConfig());

  /** @brief Records that `size` bytes left with sequence number `seq`. */
  void onPacketSent(uint64_t seq, double size);

  /**
   * @brief Records the acknowledgment of `seq`. Unknown sequence numbers are
   * ignored.
   */
  void onAck(uint64_t seq, double size, double roundTripMs);

  /**
   * @brief Folds a round-trip time observed on inbound traffic into the
   * minimum RTT filter. Does not touch the window or in-flight bytes.
   */
  void onRoundTripSample(double roundTripMs);

  /** @brief Records that `seq` was lost. Starts a new CUBIC epoch. */
  void onLoss(uint64_t seq, double size);

  /** @brief Switches to the gentler gains used for interactive sessions. */
  void setTerminalProfile();

  /** @brief Current pacing rate in bytes per second. */
  double getPacingRate() const { return pacingRate; }

  /** @brief Current congestion window in bytes. */
  double getWindow() const { return window; }

  double getInFlight() const { return inFlight; }

  /** @brief Minimum window, in bytes, that the window never drops below. */
  double getMinWindow() const { return config.minWindowPackets * config.mss; }

  CongestionPhase getPhase() const { return phase; }

  /** @brief True iff in-flight bytes are below the current window. */
  bool canSend() const { return inFlight < window; }

  CongestionStats getStats() const;

 protected:
  void updatePhase(double now);
  void updateWindow(double now);
  void enterDrain(double now);
  void enterProbeBandwidth(double now);
  void enterProbeRoundTrip(double now);
  double bandwidthDelayProduct() const;
  double cwndGainFor(CongestionPhase p) const;

  shared_ptr<Clock> clock;
  CongestionConfig config;

  CongestionPhase phase;
  double pacingGain;
  double cwndGain;
  double pacingRate;
  double deliveryRate;
  double minRoundTripMs;
  double maxBandwidth;
  int cycleIndex;
  double phaseStart;
  int64_t roundCount;
  /** @brief Round at which PROBE_ROUND_TRIP was last entered. */
  int64_t lastProbeRoundTrip;
  bool filledPipe;
  double fullBandwidth;
  int fullBandwidthCount;

  /** @brief CUBIC window before the last loss, in segments. */
  double cubicWMax;
  double cubicEpochStart;

  double window;
  double inFlight;
  double delivered;
  double deliveredTime;
  map<uint64_t, double> sentTime;
  deque<CongestionSample> samples;
};
}  // namespace ssp

#endif  // __SSP_CONGESTION_CONTROLLER__
