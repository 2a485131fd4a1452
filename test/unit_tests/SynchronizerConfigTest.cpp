#include "SynchronizerConfig.hpp"

#include "TestHeaders.hpp"

using namespace ssp;
using Catch::Approx;

namespace {
string writeConfig(const string& contents) {
  string pattern = GetTempDirectory() + string("ssp_config_XXXXXX");
  int fd = mkstemp(&pattern[0]);
  FATAL_FAIL(fd);
  ::close(fd);
  std::ofstream out(pattern);
  out << contents;
  out.close();
  return pattern;
}
}  // namespace

TEST_CASE("SynchronizerConfig defaults", "[SynchronizerConfig]") {
  SynchronizerConfig config;
  REQUIRE(config.congestion.mss == 1460);
  REQUIRE(config.congestion.initialWindowPackets == 10);
  REQUIRE(config.congestion.minWindowPackets == 4);
  REQUIRE(config.congestion.beta == Approx(0.7));
  REQUIRE(config.congestion.probeRttIntervalRounds == 10000);
  REQUIRE(config.congestion.probeRttDurationMs == 200);
  REQUIRE(config.congestion.terminalProfile);
  REQUIRE(config.reliability.redundancy == 3);
  REQUIRE(config.reliability.targetLatencyMs == 1);
  REQUIRE(config.reliability.maxRetransmits == 5);
  REQUIRE(config.reliability.maxLatencySamples == 100);
  REQUIRE(config.siteId.empty());
  REQUIRE(config.ackTimeoutMs == 1000);
}

TEST_CASE("SynchronizerConfig loads an ini file", "[SynchronizerConfig]") {
  string path = writeConfig(
      "[Congestion]\n"
      "mss = 1200\n"
      "min_window = 2\n"
      "probe_rtt_interval = 50\n"
      "terminal_profile = false\n"
      "\n"
      "[Reliability]\n"
      "redundancy = 2\n"
      "target_latency = 5.5\n"
      "\n"
      "[Session]\n"
      "site_id = primary\n"
      "ack_timeout = 250\n");

  SynchronizerConfig config;
  config.loadFromIni(path);
  REQUIRE(config.congestion.mss == 1200);
  REQUIRE(config.congestion.minWindowPackets == 2);
  REQUIRE(config.congestion.probeRttIntervalRounds == 50);
  REQUIRE_FALSE(config.congestion.terminalProfile);
  REQUIRE(config.reliability.redundancy == 2);
  REQUIRE(config.reliability.targetLatencyMs == Approx(5.5));
  REQUIRE(config.siteId == "primary");
  REQUIRE(config.ackTimeoutMs == 250);

  // Keys that are not in the file keep their defaults
  REQUIRE(config.congestion.initialWindowPackets == 10);
  REQUIRE(config.congestion.beta == Approx(0.7));
  REQUIRE(config.reliability.maxRetransmits == 5);

  FATAL_FAIL(::remove(path.c_str()));
}

TEST_CASE("SynchronizerConfig rejects bad files", "[SynchronizerConfig]") {
  SynchronizerConfig config;

  SECTION("Missing file") {
    REQUIRE_THROWS_AS(
        config.loadFromIni(GetTempDirectory() + "ssp_no_such_config.ini"),
        std::runtime_error);
  }

  SECTION("Out of range values") {
    string path = writeConfig("[Congestion]\nbeta = 1.5\n");
    REQUIRE_THROWS_AS(config.loadFromIni(path), std::runtime_error);
    FATAL_FAIL(::remove(path.c_str()));

    SynchronizerConfig other;
    path = writeConfig("[Reliability]\nredundancy = 0\n");
    REQUIRE_THROWS_AS(other.loadFromIni(path), std::runtime_error);
    FATAL_FAIL(::remove(path.c_str()));

    SynchronizerConfig third;
    path = writeConfig("[Session]\nack_timeout = 0\n");
    REQUIRE_THROWS_AS(third.loadFromIni(path), std::runtime_error);
    FATAL_FAIL(::remove(path.c_str()));
  }
}
