#include "NotificationDispatcher.hpp"

namespace ras {
NotificationDispatcher::NotificationDispatcher(const string& _sessionId,
                                               double _cooldownSeconds,
                                               BroadcastFunction _broadcast)
    : NotificationDispatcher(
          _sessionId, _cooldownSeconds, _broadcast,
          []() { return std::chrono::steady_clock::now(); }) {}

NotificationDispatcher::NotificationDispatcher(const string& _sessionId,
                                               double _cooldownSeconds,
                                               BroadcastFunction _broadcast,
                                               ClockFunction _clock)
    : sessionId(_sessionId),
      cooldown(_cooldownSeconds),
      broadcast(_broadcast),
      clock(_clock) {}

bool NotificationDispatcher::maybeNotify(const MatchResult& match,
                                         const string& displayName) {
  auto now = clock();
  {
    lock_guard<std::mutex> guard(dispatcherMutex);
    auto it = lastNotified.find(match.category);
    if (it != lastNotified.end() && now - it->second < cooldown) {
      VLOG(1) << "Suppressing notification for " << sessionId
              << " (category " << match.category << " in cooldown)";
      return false;
    }
    if (!inFlight.insert(match.category).second) {
      VLOG(1) << "Suppressing notification for " << sessionId
              << " (category " << match.category << " already sending)";
      return false;
    }
  }

  TerminalEvent event;
  TerminalNotification* notification = event.mutable_notification();
  notification->set_session_id(sessionId);
  notification->set_category(match.category);
  notification->set_pattern(match.pattern);
  notification->set_title(buildTitle(match.category, displayName));
  notification->set_snippet(match.snippet);
  notification->set_timestamp_ms(nowMillis());

  bool sent = true;
  try {
    broadcast(protoToString(event));
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Failed to broadcast notification for " << sessionId << ": "
               << re.what();
    sent = false;
  }

  lock_guard<std::mutex> guard(dispatcherMutex);
  inFlight.erase(match.category);
  if (!sent) {
    return false;
  }
  LOG(INFO) << "Notification sent for " << sessionId << ": "
            << notification->title();
  lastNotified[match.category] = now;
  return true;
}

double NotificationDispatcher::getCooldownRemaining(
    NotificationCategory category) const {
  lock_guard<std::mutex> guard(dispatcherMutex);
  auto it = lastNotified.find(category);
  if (it == lastNotified.end()) {
    return 0.0;
  }
  std::chrono::duration<double> elapsed = clock() - it->second;
  double remaining = (cooldown - elapsed).count();
  return remaining > 0.0 ? remaining : 0.0;
}

void NotificationDispatcher::clear() {
  lock_guard<std::mutex> guard(dispatcherMutex);
  lastNotified.clear();
  inFlight.clear();
}

string NotificationDispatcher::buildTitle(NotificationCategory category,
                                          const string& displayName) {
  switch (category) {
    case NOTIFICATION_APPROVAL:
      return displayName + ": Approval needed";
    case NOTIFICATION_ERROR:
      return displayName + ": Error detected";
    case NOTIFICATION_SHELL_IDLE:
      return displayName + ": Shell idle";
    default:
      return displayName;
  }
}
}  // namespace ras
