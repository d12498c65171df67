#ifndef __RAS_SUBPROCESS_UTILS__
#define __RAS_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace ras {
/**
 * @brief Runs helper binaries (tmux) without going through a shell.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs `command` with `args`, collecting stdout and stderr.
   * @param output If non-null, receives everything the child printed.
   * @return The child's exit status, or -1 if it could not be spawned or was
   * killed by a signal.
   */
  virtual int runCommand(const string& command, const vector<string>& args,
                         string* output);
};
}  // namespace ras

#endif  // __RAS_SUBPROCESS_UTILS__
