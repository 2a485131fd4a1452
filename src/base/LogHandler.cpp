#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace ssp {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %fbase:%line] %msg");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  // Simulated sessions are short; flush every line
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  conf.setGlobally(el::ConfigurationType::ToFile, "false");
  return conf;
}

void LogHandler::setupStdoutLogger() {
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"),
                                 stdoutConf);
}

string LogHandler::setupLogFile(el::Configurations *conf,
                                const string &directory, const string &prefix,
                                bool logToStdout) {
  char startTime[32];
  time_t now = time(NULL);
  strftime(startTime, sizeof(startTime), "%Y-%m-%d_%H-%M-%S",
           localtime(&now));
  string filename = prefix + "-" + startTime + "_" + to_string(getpid()) +
                    ".log";
  string path = createLogFile(directory, filename);

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  conf->setGlobally(el::ConfigurationType::Filename, path);
  conf->setGlobally(el::ConfigurationType::ToFile, "true");
  conf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                    to_string(MAX_LOG_FILE_BYTES));
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    logToStdout ? "true" : "false");
  el::Loggers::reconfigureLogger("default", *conf);
  el::Helpers::installPreRollOutCallback(LogHandler::removeRolledLog);
  return path;
}

void LogHandler::setVerbosity(int level) {
  el::Loggers::setVerboseLevel(std::max(0, std::min(level, 9)));
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  try {
    fs::create_directories(directory);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << directory
                          << ": " << fse.what() << endl;
    exit(1);
  }
  string path = (fs::path(directory) / filename).string();
  int fd = ::open(path.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  FATAL_FAIL(::close(fd));
  return path;
}

void LogHandler::removeRolledLog(const char *filename, std::size_t size) {
  // The log file is closed at this point; nothing may log here
  ::remove(filename);
}
}  // namespace ssp
