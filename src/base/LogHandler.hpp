#ifndef __CAPTERM_LOG_HANDLER__
#define __CAPTERM_LOG_HANDLER__

#include "Headers.hpp"

namespace capterm {
/**
 * @brief Configures easylogging++ for capterm binaries and tests.
 */
class LogHandler {
 public:
  // 20MB
  static const char *const DEFAULT_MAX_LOG_SIZE;

  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the file logger at `<path>/<prefix>-<time>_<pid>.log`.
   * Several capterm runs can share one log directory.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix, bool logToStdout,
                            const string &maxlogsize = DEFAULT_MAX_LOG_SIZE);

  /**
   * @brief Installs `conf` as the default logger and applies the run-wide
   * settings: `silent` turns every log off, `verboseLevel` is the VLOG
   * threshold and `threadName` names the calling thread.
   */
  static void applyLogSettings(el::Configurations *conf, bool silent,
                               int verboseLevel, const string &threadName);

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace capterm
#endif  // __CAPTERM_LOG_HANDLER__
