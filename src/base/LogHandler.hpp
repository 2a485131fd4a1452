#ifndef __SSP_LOG_HANDLER__
#define __SSP_LOG_HANDLER__

#include "Headers.hpp"

namespace ssp {
/**
 * @brief Configures easylogging++ for sspsim and ssp-test.
 *
 * Both binaries log to a per-run file, optionally echoed to stdout, and
 * print user-facing results through a separate "stdout" logger.
 */
class LogHandler {
 public:
  /** @brief Largest log file before it is rolled over. */
  static constexpr size_t MAX_LOG_FILE_BYTES = 20 * 1024 * 1024;

  /**
   * @brief Starts easylogging and returns the configuration shared by the
   * default logger.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /** @brief Sets up the "stdout" logger, which prints bare messages. */
  static void setupStdoutLogger();

  /**
   * @brief Points the default logger at a new file in `directory` and
   * applies `conf`.
   * @return Path of the log file, named after `prefix`, the start time and
   * the pid.
   */
  static string setupLogFile(el::Configurations *conf,
                             const string &directory, const string &prefix,
                             bool logToStdout);

  /** @brief Sets the VLOG level, clamped to 0..9. */
  static void setVerbosity(int level);

 private:
  static string createLogFile(const string &directory,
                              const string &filename);
  static void removeRolledLog(const char *filename, std::size_t size);
};
}  // namespace ssp
#endif  // __SSP_LOG_HANDLER__
