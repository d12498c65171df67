#ifndef __RAS_PIPE_PANE_CAPTURE__
#define __RAS_PIPE_PANE_CAPTURE__

#include "Headers.hpp"
#include "SubprocessUtils.hpp"
#include "TmuxProcessExecutor.hpp"

namespace ras {
/**
 * @brief Captures a tmux session's output with `pipe-pane` into a FIFO and
 * hands it out in chunks.
 *
 * A reader thread collects the FIFO's bytes and emits a chunk when it
 * reaches the configured size or the chunk interval has passed.
 */
class PipePaneCapture {
 public:
  typedef std::function<void(const string& sessionId, const string& data)>
      OutputCallback;

  PipePaneCapture(shared_ptr<SubprocessUtils> _subprocess,
                  const string& _sessionId, const string& _multiplexerName,
                  OutputCallback _onOutput, const TmuxConfig& _config);

  virtual ~PipePaneCapture();

  /**
   * @brief Creates the FIFO, points pipe-pane at it and starts reading.
   * @throws std::runtime_error if any step fails.
   */
  void start();

  /** @brief Turns pipe-pane off and removes the FIFO. */
  void stop();

  bool isRunning() const { return running; }

  const string& getFifoPath() const { return fifoPath; }

 protected:
  shared_ptr<SubprocessUtils> subprocess;
  string sessionId;
  string multiplexerName;
  OutputCallback onOutput;
  TmuxConfig config;
  string fifoPath;
  int readFd;
  // Held open so reads never see EOF between writers
  int keepaliveFd;
  std::atomic<bool> running;
  std::thread readerThread;

  void readLoop();
  void emit(const string& data);
  void closeFifo();
};
}  // namespace ras

#endif  // __RAS_PIPE_PANE_CAPTURE__
