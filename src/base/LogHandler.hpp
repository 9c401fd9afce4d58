#ifndef __MRM_LOG_HANDLER__
#define __MRM_LOG_HANDLER__

#include "Headers.hpp"

namespace mrm {
/**
 * @brief Configures easylogging++ for the mux daemon and the test runner.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the default logger at a new file inside `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @param maxlogsize Size in bytes at which the file is rolled out.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool appendPid = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace mrm
#endif  // __MRM_LOG_HANDLER__
