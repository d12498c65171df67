#ifndef __RAS_TMUX_PROCESS_EXECUTOR__
#define __RAS_TMUX_PROCESS_EXECUTOR__

#include "Headers.hpp"
#include "ProcessExecutor.hpp"
#include "SubprocessUtils.hpp"

namespace ras {
struct TmuxConfig {
  /** @brief tmux binary, looked up on PATH unless absolute. */
  string path = "tmux";
  /** @brief Server socket passed with -S. Empty uses the default server. */
  string socket;
  /** @brief Longest time captured output is held before it is emitted. */
  int chunkIntervalMs = 50;
  size_t maxChunkSize = 4096;

  /** @brief `tmux [-S socket]` followed by `args`. */
  vector<string> buildArgs(const vector<string>& args) const;
};

/**
 * @brief ProcessExecutor that drives tmux through its command line client.
 *
 * Keys are sent in hex (`send-keys -H`) so tmux never interprets key names
 * or shell syntax in the payload.
 */
class TmuxProcessExecutor : public ProcessExecutor {
 public:
  /** @brief Bytes passed to a single send-keys invocation. */
  static constexpr size_t MAX_KEYS_PER_COMMAND = 4096;

  TmuxProcessExecutor(shared_ptr<SubprocessUtils> _subprocess,
                      const TmuxConfig& _config);

  virtual bool sendKeys(const string& multiplexerName, const string& keys);
  virtual bool resize(const string& multiplexerName, int cols, int rows);

 protected:
  shared_ptr<SubprocessUtils> subprocess;
  TmuxConfig config;

  bool runTmux(const vector<string>& args);
};
}  // namespace ras

#endif  // __RAS_TMUX_PROCESS_EXECUTOR__
