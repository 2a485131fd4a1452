#include <cxxopts.hpp>

#include "Clock.hpp"
#include "LogHandler.hpp"
#include "SimulatedLink.hpp"
#include "SiteIdSource.hpp"
#include "Synchronizer.hpp"
#include "SynchronizerConfig.hpp"
#include "TimerHandler.hpp"

using namespace ssp;

namespace {
const int MAX_TIMER_ROUNDS = 1000000;

// Fires timers in deadline order, moving the clock along, until none are left
void runUntilIdle(shared_ptr<ManualClock> clock,
                  shared_ptr<EventLoopTimerHandler> timers) {
  for (int round = 0; round < MAX_TIMER_ROUNDS && !timers->empty(); round++) {
    double deadline = timers->nextDeadline();
    if (deadline > clock->now()) {
      clock->set(deadline);
    }
    timers->runExpired();
  }
}

string escapeForDisplay(const string& s) {
  string out;
  for (unsigned char c : s) {
    if (c == '\r') {
      out += "\\r";
    } else if (c == '\n') {
      out += "\\n";
    } else if (c < 32 || c == 0x7f) {
      char hex[8];
      snprintf(hex, sizeof(hex), "\\x%02x", c);
      out += hex;
    } else {
      out.push_back(char(c));
    }
  }
  return out;
}

void printStats(const string& name, const SynchronizerStats& stats) {
  CLOG(INFO, "stdout") << name << " (" << stats.siteId << ")" << endl;
  CLOG(INFO, "stdout") << "  congestion: phase="
                       << congestionPhaseToString(stats.congestion.phase)
                       << " window=" << stats.congestion.window
                       << " inflight=" << stats.congestion.inFlight
                       << " pacing=" << stats.congestion.pacingRate << endl;
  CLOG(INFO, "stdout") << "  resolver: revision="
                       << stats.resolver.serverRevision
                       << " pending=" << stats.resolver.pendingCount << endl;
  CLOG(INFO, "stdout") << "  buffer: visible=" << stats.buffer.visibleChars
                       << " tombstones=" << stats.buffer.tombstones
                       << " parked=" << stats.buffer.parked << endl;
  CLOG(INFO, "stdout") << "  reliability: sent="
                       << stats.reliability.packetsSent
                       << " acked=" << stats.reliability.packetsAcked
                       << " retransmitted="
                       << stats.reliability.packetsRetransmitted
                       << " abandoned=" << stats.reliability.packetsAbandoned
                       << " ratio=" << stats.reliability.reliability << endl;
  CLOG(INFO, "stdout") << "  delta: leaves=" << stats.delta.leafCount
                       << " nodes=" << stats.delta.nodeCount
                       << " depth=" << stats.delta.treeDepth << endl;
  CLOG(INFO, "stdout") << "  queued=" << stats.queuedPackets
                       << " dropped=" << stats.droppedPackets
                       << " lost=" << stats.lostPackets
                       << " abandoned=" << stats.abandonedPackets
                       << " duplicates=" << stats.duplicateUpdates << endl;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ssp::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, ssp::InterruptSignalHandler);

  cxxopts::Options options(
      "sspsim", "Runs a primary and a replica terminal over a simulated link");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("input", "Keystrokes typed on the replica",
         cxxopts::value<std::string>()->default_value("ls\r"))  //
        ("output", "Output echoed by the primary",
         cxxopts::value<std::string>()->default_value("README.md\r\n"))  //
        ("loss", "Packet loss in percent",
         cxxopts::value<int>()->default_value("0"))  //
        ("latency", "One-way link latency in ms",
         cxxopts::value<double>()->default_value("0.2"))  //
        ("seed", "Seed for the loss generator",
         cxxopts::value<int>()->default_value("1"))  //
        ("logtostdout", "log to stdout")             //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "sspsim version " << SSP_VERSION << endl;
      exit(0);
    }

    SynchronizerConfig config;
    if (result["cfgfile"].as<string>().length()) {
      try {
        config.loadFromIni(result["cfgfile"].as<string>());
      } catch (const std::runtime_error& re) {
        CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
        exit(1);
      }
    }
    // Both ends share one config; each still needs its own site id
    config.siteId.clear();

    LogHandler::setVerbosity(result["verbose"].as<int>());
    string logFile =
        LogHandler::setupLogFile(&defaultConf, GetTempDirectory(), "sspsim",
                                 result.count("logtostdout") > 0);
    VLOG(1) << "Logging to " << logFile;

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    srand(result["seed"].as<int>());

    int loss = result["loss"].as<int>();
    double latency = result["latency"].as<double>();
    if (loss < 0 || loss > 100 || latency < 0) {
      CLOG(INFO, "stdout") << "Loss must be in [0, 100] and latency >= 0"
                           << endl;
      exit(1);
    }

    shared_ptr<ManualClock> clock(new ManualClock());
    shared_ptr<EventLoopTimerHandler> timers(new EventLoopTimerHandler(clock));
    shared_ptr<SiteIdSource> siteIds(new UuidSiteIdSource());

    shared_ptr<Synchronizer> primary(
        new Synchronizer(clock, timers, siteIds, config));
    shared_ptr<Synchronizer> replica(
        new Synchronizer(clock, timers, siteIds, config));

    shared_ptr<LinkedEndpoint> primaryEndpoint(new LinkedEndpoint(
        shared_ptr<SimulatedLink>(new SimulatedLink(timers, latency, loss))));
    primaryEndpoint->connect(replica);
    primary->addListener(primaryEndpoint);
    shared_ptr<LinkedEndpoint> replicaEndpoint(new LinkedEndpoint(
        shared_ptr<SimulatedLink>(new SimulatedLink(timers, latency, loss))));
    replicaEndpoint->connect(primary);
    replica->addListener(replicaEndpoint);

    LOG(INFO) << "Simulating with latency " << latency << " ms and loss "
              << loss << "%";

    // Keystrokes arrive one at a time
    for (char c : result["input"].as<string>()) {
      replica->sendInput(string(1, c));
      clock->advance(1);
      runUntilIdle(clock, timers);
    }

    primary->processOutput(result["output"].as<string>());
    runUntilIdle(clock, timers);

    vector<string> missing =
        replica->sync(primary->getMerkleRoot(), primary->getNodeTable());
    for (const auto& leaf : missing) {
      if (!replica->applySyncedLeaf(leaf)) {
        LOG(WARNING) << "Delta sync returned a leaf that is not output";
      }
    }

    string primaryState = primary->getState();
    string replicaState = replica->getState();
    CLOG(INFO, "stdout") << "primary: \"" << escapeForDisplay(primaryState)
                         << "\"" << endl;
    CLOG(INFO, "stdout") << "replica: \"" << escapeForDisplay(replicaState)
                         << "\"" << endl;
    CLOG(INFO, "stdout") << "delta sync transferred " << missing.size()
                         << " leaves, roots "
                         << (primary->getMerkleRoot() ==
                                     replica->getMerkleRoot()
                                 ? "match"
                                 : "differ")
                         << endl;
    CLOG(INFO, "stdout") << "converged: "
                         << (primaryState == replicaState ? "yes" : "no")
                         << endl;
    printStats("primary", primary->getStats());
    printStats("replica", replica->getStats());
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
