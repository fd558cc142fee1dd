#ifndef __UEX_LOG_HANDLER__
#define __UEX_LOG_HANDLER__

#include "Headers.hpp"

namespace uex {
/**
 * @brief Configures easylogging++ for programs and test runners that drive
 * sessions.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging inside `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false, bool appendPid = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

  /**
   * @brief Creates (or reconfigures) a message-only logger that session
   * output can be mirrored into.
   * @param loggerId easylogging++ logger id, e.g. "session".
   * @param toStdout Whether the logger also writes to standard output.
   */
  static el::Logger *setupSessionLogger(const string &loggerId,
                                        bool toStdout = false);

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace uex
#endif  // __UEX_LOG_HANDLER__
