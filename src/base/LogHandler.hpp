#ifndef __DW_LOG_HANDLER__
#define __DW_LOG_HANDLER__

#include "Headers.hpp"

namespace dw {
/**
 * @brief Configures easylogging++ for applications and tests embedding the
 * client.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging with size based rotation.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
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
}  // namespace dw
#endif  // __DW_LOG_HANDLER__
