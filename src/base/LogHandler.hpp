#ifndef __RAS_LOG_HANDLER__
#define __RAS_LOG_HANDLER__

#include "Headers.hpp"

namespace ras {
/**
 * @brief Configures easylogging++ for the daemon and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging with the process arguments.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the default logger at a fresh file in `directory`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @param maxLogSize Size in bytes after which the file is rolled over.
   */
  static void setupLogFiles(el::Configurations *defaultConf,
                            const string &directory,
                            const string &filenamePrefix, bool logToStdout,
                            const string &maxLogSize = "20971520");

  /**
   * @brief Rollover callback; drops the full log so a new one is started.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the `stdout` logger so it only prints the message.
   */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &directory,
                              const string &filename);
};
}  // namespace ras
#endif  // __RAS_LOG_HANDLER__
