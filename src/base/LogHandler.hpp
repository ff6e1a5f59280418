#ifndef __TT_LOG_HANDLER__
#define __TT_LOG_HANDLER__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Configures easylogging++ so toggleterm can control log files.
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
   * @return Full path of the created log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false, bool appendPid = false,
                              string maxlogsize = "20971520");

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
}  // namespace tt
#endif  // __TT_LOG_HANDLER__
