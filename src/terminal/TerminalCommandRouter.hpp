#ifndef __RAS_TERMINAL_COMMAND_ROUTER__
#define __RAS_TERMINAL_COMMAND_ROUTER__

#include "Headers.hpp"
#include "TerminalManager.hpp"

namespace ras {
/**
 * @brief Routes `TerminalCommand`s from devices to the terminal manager.
 *
 * The handler table is keyed by the command's oneof case and built once.
 * Every handler runs on the router's pool under the same time budget; a
 * handler that runs over is reported as failed and left to finish in the
 * background.
 */
class TerminalCommandRouter {
 public:
  typedef std::function<void(const string& deviceId,
                             const TerminalCommand& command)>
      Handler;

  static constexpr int DEFAULT_HANDLER_THREADS = 4;
  static constexpr int DEFAULT_BUDGET_MS = 5000;

  TerminalCommandRouter(shared_ptr<TerminalManager> _manager,
                        int handlerThreads = DEFAULT_HANDLER_THREADS,
                        std::chrono::milliseconds _budget =
                            std::chrono::milliseconds(DEFAULT_BUDGET_MS));

  virtual ~TerminalCommandRouter();

  /**
   * @brief Parses and runs a serialized command.
   * @return false when the payload does not parse, the command is unknown,
   * or the handler did not finish within the budget.
   */
  bool dispatch(const string& deviceId, const string& serializedCommand);

  bool dispatch(const string& deviceId, const TerminalCommand& command);

  /** @brief Waits for running handlers and rejects new commands. */
  void shutdown();

 protected:
  shared_ptr<TerminalManager> manager;
  std::chrono::milliseconds budget;
  std::map<TerminalCommand::CommandCase, Handler> handlers;
  std::unique_ptr<ThreadPool> handlerPool;
  std::mutex poolMutex;

  void handleAttach(const string& deviceId, const AttachTerminal& attach);
  void handleDetach(const string& deviceId, const DetachTerminal& detach);
  void handleInput(const string& deviceId, const TerminalInput& input);
  void handleResize(const string& deviceId, const TerminalResize& resize);
};
}  // namespace ras

#endif  // __RAS_TERMINAL_COMMAND_ROUTER__
