#ifndef __SSP_SYNCHRONIZER_CONFIG__
#define __SSP_SYNCHRONIZER_CONFIG__

#include "CongestionController.hpp"
#include "Headers.hpp"
#include "ReliabilityLayer.hpp"

namespace ssp {
/**
 * @brief Every tunable of a Synchronizer session.
 */
struct SynchronizerConfig {
  CongestionConfig congestion;
  ReliabilityConfig reliability;
  /** @brief Site identifier. Empty means "ask the SiteIdSource". */
  string siteId;
  /**
   * @brief Time a normal-path packet may stay unacknowledged before it
   * counts as lost and is sent again.
   */
  double ackTimeoutMs = 1000;

  /**
   * @brief Overrides fields with the values found in an INI file.
   *
   * Reads the [Congestion], [Reliability] and [Session] sections. Keys that
   * are absent keep their current value.
   * @throws std::runtime_error if the file cannot be loaded or a value is
   * out of range.
   */
  void loadFromIni(const string& path);
};
}  // namespace ssp

#endif  // __SSP_SYNCHRONIZER_CONFIG__
