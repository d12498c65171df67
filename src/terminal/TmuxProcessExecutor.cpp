#include "TmuxProcessExecutor.hpp"

namespace ras {
vector<string> TmuxConfig::buildArgs(const vector<string>& args) const {
  vector<string> fullArgs;
  if (!socket.empty()) {
    fullArgs.push_back("-S");
    fullArgs.push_back(socket);
  }
  fullArgs.insert(fullArgs.end(), args.begin(), args.end());
  return fullArgs;
}

TmuxProcessExecutor::TmuxProcessExecutor(
    shared_ptr<SubprocessUtils> _subprocess, const TmuxConfig& _config)
    : subprocess(_subprocess), config(_config) {}

bool TmuxProcessExecutor::sendKeys(const string& multiplexerName,
                                   const string& keys) {
  for (size_t offset = 0; offset < keys.size();
       offset += MAX_KEYS_PER_COMMAND) {
    size_t end = min(keys.size(), offset + MAX_KEYS_PER_COMMAND);
    vector<string> args = {"send-keys", "-t", multiplexerName, "-H"};
    for (size_t i = offset; i < end; i++) {
      char hex[3];
      snprintf(hex, sizeof(hex), "%02x", (unsigned char)keys[i]);
      args.push_back(hex);
    }
    if (!runTmux(args)) {
      return false;
    }
  }
  return true;
}

bool TmuxProcessExecutor::resize(const string& multiplexerName, int cols,
                                 int rows) {
  return runTmux({"resize-window", "-t", multiplexerName, "-x",
                  std::to_string(cols), "-y", std::to_string(rows)});
}

bool TmuxProcessExecutor::runTmux(const vector<string>& args) {
  string output;
  int exitCode = subprocess->runCommand(config.path, config.buildArgs(args),
                                        &output);
  if (exitCode != 0) {
    LOG(ERROR) << "tmux " << args[0] << " failed (" << exitCode
               << "): " << output;
    return false;
  }
  return true;
}
}  // namespace ras
