#include "SynchronizerConfig.hpp"

#include "SimpleIni.h"

namespace ssp {
namespace {
void readDouble(const CSimpleIniA& ini, const char* section, const char* key,
                double* value) {
  const char* raw = ini.GetValue(section, key, NULL);
  if (raw) {
    *value = ini.GetDoubleValue(section, key, *value);
  }
}

void readInt(const CSimpleIniA& ini, const char* section, const char* key,
             int* value) {
  const char* raw = ini.GetValue(section, key, NULL);
  if (raw) {
    *value = int(ini.GetLongValue(section, key, *value));
  }
}
}  // namespace

void SynchronizerConfig::loadFromIni(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  readDouble(ini, "Congestion", "mss", &congestion.mss);
  readDouble(ini, "Congestion", "initial_window",
             &congestion.initialWindowPackets);
  readDouble(ini, "Congestion", "min_window", &congestion.minWindowPackets);
  readDouble(ini, "Congestion", "beta", &congestion.beta);
  readDouble(ini, "Congestion", "cubic_c", &congestion.cubicC);
  readDouble(ini, "Congestion", "startup_growth",
             &congestion.startupGrowthThreshold);
  readInt(ini, "Congestion", "startup_rounds",
          &congestion.startupFullBandwidthRounds);
  readDouble(ini, "Congestion", "probe_rtt_duration",
             &congestion.probeRttDurationMs);
  const char* interval = ini.GetValue("Congestion", "probe_rtt_interval", NULL);
  if (interval) {
    congestion.probeRttIntervalRounds =
        ini.GetLongValue("Congestion", "probe_rtt_interval",
                         long(congestion.probeRttIntervalRounds));
  }
  congestion.terminalProfile = ini.GetBoolValue(
      "Congestion", "terminal_profile", congestion.terminalProfile);

  readInt(ini, "Reliability", "redundancy", &reliability.redundancy);
  readDouble(ini, "Reliability", "target_latency",
             &reliability.targetLatencyMs);
  readInt(ini, "Reliability", "max_retransmits", &reliability.maxRetransmits);

  const char* site = ini.GetValue("Session", "site_id", NULL);
  if (site) {
    siteId = string(site);
  }
  readDouble(ini, "Session", "ack_timeout", &ackTimeoutMs);

  if (congestion.mss <= 0 || congestion.minWindowPackets <= 0) {
    throw std::runtime_error("Invalid congestion window in " + path);
  }
  if (congestion.beta <= 0 || congestion.beta >= 1) {
    throw std::runtime_error("Congestion beta must be in (0, 1) in " + path);
  }
  if (reliability.redundancy < 1 || reliability.maxRetransmits < 0 ||
      reliability.targetLatencyMs <= 0) {
    throw std::runtime_error("Invalid reliability settings in " + path);
  }
  if (ackTimeoutMs <= 0) {
    throw std::runtime_error("Ack timeout must be positive in " + path);
  }
  LOG(INFO) << "Loaded config from " << path;
}
}  // namespace ssp
