#ifndef __RAS_NOTIFICATION_DISPATCHER__
#define __RAS_NOTIFICATION_DISPATCHER__

#include "Headers.hpp"
#include "PatternMatcher.hpp"

namespace ras {
/**
 * @brief Turns a session's pattern matches into notification events,
 * suppressing repeats of a category until its cooldown has passed.
 */
class NotificationDispatcher {
 public:
  typedef std::function<void(const string&)> BroadcastFunction;
  typedef std::function<std::chrono::steady_clock::time_point()> ClockFunction;

  NotificationDispatcher(const string& _sessionId, double _cooldownSeconds,
                         BroadcastFunction _broadcast);
  NotificationDispatcher(const string& _sessionId, double _cooldownSeconds,
                         BroadcastFunction _broadcast, ClockFunction _clock);

  /**
   * @brief Broadcasts a `TerminalNotification` for `match` unless the same
   * category fired within the cooldown. The broadcaster is called without
   * holding the dispatcher lock, and the cooldown only starts once it
   * returns without throwing.
   * @param displayName Used in the notification title.
   * @return true if the notification was handed to the broadcaster.
   */
  bool maybeNotify(const MatchResult& match, const string& displayName);

  /** @brief Seconds until `category` may fire again, 0 if it may fire now. */
  double getCooldownRemaining(NotificationCategory category) const;

  /** @brief Forgets every cooldown. */
  void clear();

  static string buildTitle(NotificationCategory category,
                           const string& displayName);

 protected:
  string sessionId;
  std::chrono::duration<double> cooldown;
  BroadcastFunction broadcast;
  ClockFunction clock;
  std::map<NotificationCategory, std::chrono::steady_clock::time_point>
      lastNotified;
  // Categories whose broadcast is running outside the lock
  std::set<NotificationCategory> inFlight;
  mutable std::mutex dispatcherMutex;
};
}  // namespace ras

#endif  // __RAS_NOTIFICATION_DISPATCHER__
