#include "CongestionController.hpp"

namespace ssp {
namespace {
// PROBE_BANDWIDTH pacing gain cycle, one phase per min RTT.
const double PROBE_BANDWIDTH_GAINS[] = {1.25, 0.75, 1.0, 1.0,
                                        1.0,  1.0,  1.0, 1.0};
const int PROBE_BANDWIDTH_CYCLE_LENGTH = 8;
}  // namespace

string congestionPhaseToString(CongestionPhase phase) {
  switch (phase) {
    case CongestionPhase::STARTUP:
      return "startup";
    case CongestionPhase::DRAIN:
      return "drain";
    case CongestionPhase::PROBE_BANDWIDTH:
      return "probe_bw";
    case CongestionPhase::PROBE_ROUND_TRIP:
      return "probe_rtt";
  }
  return "unknown";
}

CongestionController::CongestionController(shared_ptr<Clock> _clock,
                                           const CongestionConfig& _config)
    : clock(_clock),
      config(_config),
      phase(CongestionPhase::STARTUP),
      pacingRate(0),
      deliveryRate(0),
      minRoundTripMs(std::numeric_limits<double>::infinity()),
      maxBandwidth(0),
      cycleIndex(0),
      roundCount(0),
      lastProbeRoundTrip(0),
      filledPipe(false),
      fullBandwidth(0),
      fullBandwidthCount(0),
      inFlight(0),
      delivered(0) {
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }
  double now = clock->now();
  pacingGain = config.terminalProfile ? config.terminalPacingGain
                                      : config.startupPacingGain;
  cwndGain = cwndGainFor(phase);
  phaseStart = now;
  deliveredTime = now;
  window = std::max(config.initialWindowPackets, config.minWindowPackets) *
           config.mss;
  cubicWMax = window / config.mss;
  cubicEpochStart = now;
}

void CongestionController::onPacketSent(uint64_t seq, double size) {
  sentTime[seq] = clock->now();
  inFlight += size;
}

void CongestionController::onAck(uint64_t seq, double size,
                                 double roundTripMs) {
  auto it = sentTime.find(seq);
  if (it == sentTime.end()) {
    VLOG(3) << "Ignoring ack for unknown sequence " << seq;
    return;
  }
  sentTime.erase(it);
  inFlight = std::max(0.0, inFlight - size);
  delivered += size;

  if (roundTripMs >= 0) {
    minRoundTripMs = std::min(minRoundTripMs, roundTripMs);
  }

  double now = clock->now();
  double interval = now - deliveredTime;
  if (interval > 0) {
    CongestionSample sample;
    sample.bytesDelivered = size;
    sample.roundTripMs = roundTripMs;
    sample.timestamp = now;
    sample.rate = (size / interval) * 1000.0;
    samples.push_back(sample);
    while (samples.size() > config.maxRateSamples) {
      samples.pop_front();
    }

    // Max filter over the recent window, as BBR does
    deliveryRate = 0;
    for (const auto& s : samples) {
      deliveryRate = std::max(deliveryRate, s.rate);
    }
    maxBandwidth = std::max(maxBandwidth, deliveryRate);
  }

  deliveredTime = now;
  roundCount++;

  updatePhase(now);
  if (phase != CongestionPhase::PROBE_ROUND_TRIP &&
      std::isinf(minRoundTripMs) && roundTripMs >= 0) {
    // The filter was just reset by PROBE_ROUND_TRIP; this ack is the fresh
    // measurement.
    minRoundTripMs = roundTripMs;
  }
  updateWindow(now);
}

void CongestionController::onRoundTripSample(double roundTripMs) {
  if (roundTripMs < 0) {
    return;
  }
  minRoundTripMs = std::min(minRoundTripMs, roundTripMs);
}

void CongestionController::onLoss(uint64_t seq, double size) {
  auto it = sentTime.find(seq);
  if (it != sentTime.end()) {
    sentTime.erase(it);
    inFlight = std::max(0.0, inFlight - size);
  }

  // CUBIC congestion event. BBR does not react to isolated losses: the phase
  // stays where it is and the next ack recomputes the model-based window.
  double now = clock->now();
  cubicWMax = window / config.mss;
  cubicEpochStart = now;
  window = std::max(window * config.beta, getMinWindow());
  VLOG(1) << "Loss on seq " << seq << ", window reduced to " << window;
}

void CongestionController::setTerminalProfile() {
  config.terminalProfile = true;
  cwndGain = cwndGainFor(phase);
  if (phase == CongestionPhase::STARTUP) {
    pacingGain = config.terminalPacingGain;
  }
}

CongestionStats CongestionController::getStats() const {
  CongestionStats stats;
  stats.phase = phase;
  stats.window = window;
  stats.inFlight = inFlight;
  stats.minRoundTripMs = minRoundTripMs;
  stats.maxBandwidth = maxBandwidth;
  stats.deliveryRate = deliveryRate;
  stats.pacingRate = pacingRate;
  stats.roundCount = roundCount;
  return stats;
}

void CongestionController::updatePhase(double now) {
  double elapsed = now - phaseStart;

  switch (phase) {
    case CongestionPhase::STARTUP:
      // Stay in startup while the bandwidth estimate keeps growing
      if (maxBandwidth <= 0) {
        break;
      }
      if (maxBandwidth >= fullBandwidth * config.startupGrowthThreshold) {
        fullBandwidth = maxBandwidth;
        fullBandwidthCount = 0;
        break;
      }
      fullBandwidthCount++;
      if (fullBandwidthCount >= config.startupFullBandwidthRounds) {
        filledPipe = true;
        enterDrain(now);
      }
      break;

    case CongestionPhase::DRAIN:
      if (inFlight <= bandwidthDelayProduct()) {
        enterProbeBandwidth(now);
      }
      break;

    case CongestionPhase::PROBE_BANDWIDTH:
      if (elapsed > minRoundTripMs) {
        cycleIndex = (cycleIndex + 1) % PROBE_BANDWIDTH_CYCLE_LENGTH;
        pacingGain = PROBE_BANDWIDTH_GAINS[cycleIndex];
        phaseStart = now;
      }
      // Rounds spent in STARTUP or DRAIN count toward the interval
      if (config.probeRttIntervalRounds > 0 &&
          roundCount - lastProbeRoundTrip >= config.probeRttIntervalRounds) {
        enterProbeRoundTrip(now);
      }
      break;

    case CongestionPhase::PROBE_ROUND_TRIP:
      if (elapsed > config.probeRttDurationMs) {
        // Forget the stale minimum; the next sample re-seeds it.
        minRoundTripMs = std::numeric_limits<double>::infinity();
        enterProbeBandwidth(now);
      }
      break;
  }
}

void CongestionController::enterDrain(double now) {
  VLOG(1) << "Pipe filled at " << maxBandwidth << " B/s, entering drain";
  phase = CongestionPhase::DRAIN;
  pacingGain = config.drainPacingGain;
  cwndGain = cwndGainFor(phase);
  phaseStart = now;
}

void CongestionController::enterProbeBandwidth(double now) {
  VLOG(1) << "Entering probe_bw";
  phase = CongestionPhase::PROBE_BANDWIDTH;
  cycleIndex = int(randombytes_uniform(PROBE_BANDWIDTH_CYCLE_LENGTH));
  pacingGain = PROBE_BANDWIDTH_GAINS[cycleIndex];
  cwndGain = cwndGainFor(phase);
  phaseStart = now;
}

void CongestionController::enterProbeRoundTrip(double now) {
  VLOG(1) << "Entering probe_rtt after " << roundCount << " rounds";
  phase = CongestionPhase::PROBE_ROUND_TRIP;
  lastProbeRoundTrip = roundCount;
  pacingGain = 1.0;
  cwndGain = cwndGainFor(phase);
  phaseStart = now;
}

double CongestionController::bandwidthDelayProduct() const {
  if (std::isinf(minRoundTripMs)) {
    return 0;
  }
  return maxBandwidth * (minRoundTripMs / 1000.0);
}

double CongestionController::cwndGainFor(CongestionPhase p) const {
  if (p == CongestionPhase::PROBE_ROUND_TRIP) {
    return 1.0;
  }
  return config.terminalProfile ? config.terminalCwndGain
                                : config.defaultCwndGain;
}

void CongestionController::updateWindow(double now) {
  double minWindow = getMinWindow();

  switch (phase) {
    case CongestionPhase::STARTUP:
    case CongestionPhase::PROBE_BANDWIDTH: {
      double bdp = bandwidthDelayProduct();
      double target = bdp > 0 ? bdp * cwndGain
                              : config.initialWindowPackets * config.mss;
      window = std::max(target, minWindow);
      break;
    }

    case CongestionPhase::PROBE_ROUND_TRIP:
      window = minWindow;
      break;

    case CongestionPhase::DRAIN: {
      // W(t) = C * (t - K)^3 + Wmax, in segments, t in seconds
      double t = std::max(0.0, now - cubicEpochStart) / 1000.0;
      double k = std::cbrt((cubicWMax * (1 - config.beta)) / config.cubicC);
      double cubicWindow = config.cubicC * std::pow(t - k, 3) + cubicWMax;
      double rttSeconds =
          std::isinf(minRoundTripMs) || minRoundTripMs <= 0
              ? 1.0
              : minRoundTripMs / 1000.0;
      double tcpFriendlyWindow =
          cubicWMax * config.beta +
          ((3 * (1 - config.beta)) / (1 + config.beta)) * (t / rttSeconds);
      window = std::max({cubicWindow * config.mss,
                         tcpFriendlyWindow * config.mss, minWindow});
      break;
    }
  }

  pacingRate = maxBandwidth * pacingGain;
}
}  // namespace ssp
