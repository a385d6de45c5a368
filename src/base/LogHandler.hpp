#ifndef __TT_LOG_HANDLER__
#define __TT_LOG_HANDLER__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Thrown when the log directory or file cannot be created.
 */
class LogFileException : public std::runtime_error {
 public:
  explicit LogFileException(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Where and how the tunnel client writes its log.
 */
struct LogFileOptions {
  string directory;
  string prefix = "tooltunnel";
  bool toStdout = false;
  // Send stderr (crash output, library noise) to a sibling file
  bool captureStderr = false;
  uint64_t maxLogSize = 20 * 1024 * 1024;
};

/**
 * @brief Configures easylogging++ for the tunnel client and its tests.
 *
 * Every run gets a fresh timestamped file. When it reaches maxLogSize the
 * previous contents are kept as `<file>.1` and the file starts over, so a
 * long-lived tunnel never holds more than two generations on disk.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int* argc, char*** argv);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

  /**
   * @brief Creates the log file and points `defaultConf` at it.
   * @return The full path of the new log file.
   * @throws LogFileException if the directory or file cannot be created.
   */
  static string setupLogFiles(el::Configurations* defaultConf,
                              const LogFileOptions& options);

  /** @brief Pre-rollout callback that keeps one previous generation. */
  static void rolloutHandler(const char* filename, std::size_t size);

  /** @brief `<prefix>-<tag>-YYYY-mm-dd_HH-MM-SS.log`, tag omitted if empty. */
  static string logFileName(const string& prefix, const string& tag);

 private:
  static string createLogFile(const string& directory,
                              const string& filename);
};
}  // namespace tt
#endif  // __TT_LOG_HANDLER__
