#ifndef __TT_SUBPROCESS_UTILS__
#define __TT_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace tt {
/**
 * @brief What to run: argv[0] is looked up on PATH.
 */
struct SubprocessRequest {
  vector<string> argv;
  /** @brief Added to (or overriding) the parent environment. */
  vector<pair<string, string>> environment;
  /** @brief Empty means inherit the current directory. */
  string workingDirectory;
  std::chrono::milliseconds timeout = std::chrono::seconds(30);
};

struct SubprocessResult {
  string standardOutput;
  string standardError;
  /** @brief Exit status, or -1 if the process never ran or was signalled. */
  int exitCode = -1;
  bool timedOut = false;
  /** @brief Empty on a clean zero exit. */
  string error;
};

/**
 * @brief Utility class for executing subprocesses and capturing output.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command without a shell, capturing stdout and stderr
   * separately. The child's process group is killed when the timeout expires.
   */
  virtual SubprocessResult run(const SubprocessRequest& request);
};
}  // namespace tt

#endif  // __TT_SUBPROCESS_UTILS__
