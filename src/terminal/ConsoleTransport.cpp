#include "ConsoleTransport.hpp"

namespace ras {
void ConsoleTransport::send(const string& deviceId, const string& event) {
  printEvent(deviceId, event);
}

void ConsoleTransport::broadcast(const string& event) {
  printEvent("*", event);
}

void ConsoleTransport::printEvent(const string& target, const string& event) {
  TerminalEvent terminalEvent;
  if (!parseProto(event, &terminalEvent)) {
    throw std::runtime_error("Unparseable terminal event");
  }
  lock_guard<std::mutex> guard(printMutex);
  switch (terminalEvent.event_case()) {
    case TerminalEvent::kOutput:
      VLOG(2) << "[" << target << "] output #"
              << terminalEvent.output().sequence() << " ("
              << terminalEvent.output().data().size() << " bytes)";
      break;
    case TerminalEvent::kSkipped:
      CLOG(INFO, "stdout") << "[" << target << "] skipped output "
                           << terminalEvent.skipped().from_sequence() << "-"
                           << terminalEvent.skipped().to_sequence();
      break;
    case TerminalEvent::kAttached:
      CLOG(INFO, "stdout") << "[" << target << "] attached to "
                           << terminalEvent.attached().session_id();
      break;
    case TerminalEvent::kDetached:
      CLOG(INFO, "stdout") << "[" << target << "] detached from "
                           << terminalEvent.detached().session_id() << " ("
                           << terminalEvent.detached().reason() << ")";
      break;
    case TerminalEvent::kError:
      CLOG(INFO, "stdout") << "[" << target << "] error "
                           << terminalEvent.error().code() << ": "
                           << terminalEvent.error().message();
      break;
    case TerminalEvent::kNotification:
      CLOG(INFO, "stdout") << "[" << target << "] "
                           << terminalEvent.notification().title() << ": "
                           << terminalEvent.notification().snippet();
      break;
    default:
      LOG(WARNING) << "Empty terminal event for " << target;
      break;
  }
}
}  // namespace ras
