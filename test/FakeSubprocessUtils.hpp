#ifndef __RAS_FAKE_SUBPROCESS_UTILS_HPP__
#define __RAS_FAKE_SUBPROCESS_UTILS_HPP__

#include "SubprocessUtils.hpp"

namespace ras {
/**
 * Records tmux invocations instead of running them.
 */
class FakeSubprocessUtils : public SubprocessUtils {
 public:
  FakeSubprocessUtils() : exitCode(0) {}

  virtual int runCommand(const string& command, const vector<string>& args,
                         string* output) {
    lock_guard<std::mutex> guard(commandsMutex);
    commands.push_back(make_pair(command, args));
    if (output) {
      *output = exitCode == 0 ? "" : "no server running";
    }
    return exitCode;
  }

  vector<pair<string, vector<string>>> getCommands() {
    lock_guard<std::mutex> guard(commandsMutex);
    return commands;
  }

  int exitCode;

 protected:
  vector<pair<string, vector<string>>> commands;
  std::mutex commandsMutex;
};
}  // namespace ras

#endif
