#include "TerminalCommandRouter.hpp"

namespace ras {
TerminalCommandRouter::TerminalCommandRouter(
    shared_ptr<TerminalManager> _manager, int handlerThreads,
    std::chrono::milliseconds _budget)
    : manager(_manager),
      budget(_budget),
      handlerPool(new ThreadPool(max(1, handlerThreads))) {
  handlers[TerminalCommand::kAttach] = [this](const string& deviceId,
                                              const TerminalCommand& command) {
    handleAttach(deviceId, command.attach());
  };
  handlers[TerminalCommand::kDetach] = [this](const string& deviceId,
                                              const TerminalCommand& command) {
    handleDetach(deviceId, command.detach());
  };
  handlers[TerminalCommand::kInput] = [this](const string& deviceId,
                                             const TerminalCommand& command) {
    handleInput(deviceId, command.input());
  };
  handlers[TerminalCommand::kResize] = [this](const string& deviceId,
                                              const TerminalCommand& command) {
    handleResize(deviceId, command.resize());
  };
}

TerminalCommandRouter::~TerminalCommandRouter() { shutdown(); }

bool TerminalCommandRouter::dispatch(const string& deviceId,
                                     const string& serializedCommand) {
  TerminalCommand command;
  if (!parseProto(serializedCommand, &command)) {
    LOG(ERROR) << "Dropping unparseable command from " << deviceId << " ("
               << serializedCommand.size() << " bytes)";
    return false;
  }
  return dispatch(deviceId, command);
}

bool TerminalCommandRouter::dispatch(const string& deviceId,
                                     const TerminalCommand& command) {
  auto it = handlers.find(command.command_case());
  if (it == handlers.end()) {
    LOG(WARNING) << "Ignoring terminal command with unknown type "
                 << int(command.command_case()) << " from " << deviceId;
    return false;
  }
  Handler handler = it->second;

  std::future<void> result;
  {
    lock_guard<std::mutex> guard(poolMutex);
    if (!handlerPool) {
      LOG(WARNING) << "Rejecting command from " << deviceId
                   << " during shutdown";
      return false;
    }
    result = handlerPool->enqueue([handler, deviceId, command]() {
      try {
        handler(deviceId, command);
      } catch (const std::exception& e) {
        LOG(ERROR) << "Terminal command from " << deviceId
                   << " failed: " << e.what();
      }
    });
  }

  if (result.wait_for(budget) != std::future_status::ready) {
    LOG(WARNING) << "Terminal command " << int(command.command_case())
                 << " from " << deviceId << " exceeded " << budget.count()
                 << "ms";
    return false;
  }
  result.get();
  return true;
}

void TerminalCommandRouter::shutdown() {
  std::unique_ptr<ThreadPool> pool;
  {
    lock_guard<std::mutex> guard(poolMutex);
    pool = std::move(handlerPool);
  }
  pool.reset();
}

void TerminalCommandRouter::handleAttach(const string& deviceId,
                                         const AttachTerminal& attach) {
  optional<uint64_t> lastSeen;
  if (attach.has_last_seen_sequence()) {
    lastSeen = attach.last_seen_sequence();
  }
  manager->attach(deviceId, attach.session_id(), lastSeen);
}

void TerminalCommandRouter::handleDetach(const string& deviceId,
                                         const DetachTerminal& detach) {
  manager->detach(deviceId, detach.session_id());
}

void TerminalCommandRouter::handleInput(const string& deviceId,
                                        const TerminalInput& input) {
  manager->handleInput(deviceId, input);
}

void TerminalCommandRouter::handleResize(const string& deviceId,
                                         const TerminalResize& resize) {
  auto validationError = InputValidator::validateSessionId(resize.session_id());
  if (validationError) {
    manager->reportError(deviceId, resize.session_id(), validationError->code,
                         validationError->message);
    return;
  }
  if (!manager->handleResize(resize.session_id(), resize.cols(),
                             resize.rows())) {
    manager->reportError(deviceId, resize.session_id(),
                         TerminalErrorCode::RESIZE_FAILED,
                         "Failed to resize session");
  }
}
}  // namespace ras
