#ifndef __RAS_TERMINAL_MANAGER__
#define __RAS_TERMINAL_MANAGER__

#include "DeviceOutbox.hpp"
#include "DeviceTransport.hpp"
#include "Headers.hpp"
#include "InputValidator.hpp"
#include "NotificationDispatcher.hpp"
#include "PatternMatcher.hpp"
#include "ProcessExecutor.hpp"
#include "ReplayBuffer.hpp"
#include "SessionDirectory.hpp"

namespace ras {
struct TerminalManagerOptions {
  /** @brief Byte budget of each session's replay buffer. */
  size_t bufferSize = ReplayBuffer::DEFAULT_MAX_SIZE;
  /** @brief Events queued per device before new ones are dropped. */
  size_t maxPendingEvents = DeviceOutbox::DEFAULT_MAX_PENDING;
  /** @brief Threads delivering events to devices. */
  int sendThreads = 4;
  int rateLimitPerSecond = RATE_LIMIT_PER_SECOND;
  bool notificationsEnabled = true;
};

/**
 * @brief Connects tmux sessions to the remote devices watching them.
 *
 * For every session with activity the manager owns a replay buffer, the set
 * of attached devices and a pattern matcher with its notification
 * dispatcher. Output is buffered, fanned out to attached devices and
 * scanned for notifications. Requests from devices are validated before
 * anything reaches tmux, and every problem is reported to the requesting
 * device only.
 *
 * Events are delivered through a bounded outbox per device, drained on a
 * thread pool, so a slow device never holds up output processing or other
 * devices.
 */
class TerminalManager {
 public:
  TerminalManager(shared_ptr<SessionDirectory> _directory,
                  shared_ptr<ProcessExecutor> _executor,
                  shared_ptr<DeviceTransport> _transport,
                  shared_ptr<const NotificationConfig> _notificationConfig,
                  const TerminalManagerOptions& _options =
                      TerminalManagerOptions());

  virtual ~TerminalManager();

  /**
   * @brief Subscribes a device to a session's output.
   *
   * The device receives `TerminalAttached`, then, when `lastSeenSequence` is
   * set, everything buffered after it. If some of that output was evicted an
   * `OutputSkipped` event precedes the replay.
   */
  void attach(const string& deviceId, const string& sessionId,
              optional<uint64_t> lastSeenSequence);

  /** @brief Unsubscribes a device. The session's history is kept. */
  void detach(const string& deviceId, const string& sessionId);

  /** @brief Validates and forwards keystrokes from an attached device. */
  void handleInput(const string& deviceId, const TerminalInput& input);

  /** @brief Resizes the session's window. */
  bool handleResize(const string& sessionId, int cols, int rows);

  /** @brief Entry point for captured output. */
  void onOutput(const string& sessionId, const string& data);

  /** @brief Drops every piece of state for a session that was killed. */
  void onSessionKilled(const string& sessionId);

  /** @brief Detaches a device from everything and drops its outbox. */
  void onDeviceDisconnected(const string& deviceId);

  /** @brief Sends a `TerminalError` to one device. */
  void reportError(const string& deviceId, const string& sessionId,
                   const string& code, const string& message);

  size_t getAttachmentCount(const string& sessionId);
  bool isSessionAttached(const string& sessionId);
  bool hasSession(const string& sessionId);
  /** @brief The session a device is attached to, if any. */
  optional<string> getAttachedSession(const string& deviceId);

  /** @brief Finishes queued deliveries and forgets all sessions. */
  void shutdown();

 protected:
  struct SessionState {
    explicit SessionState(size_t bufferSize)
        : buffer(bufferSize), tornDown(false) {}

    ReplayBuffer buffer;
    unordered_set<string> attachments;
    unique_ptr<PatternMatcher> matcher;
    unique_ptr<NotificationDispatcher> dispatcher;
    /** @brief Orders appends, fan-out and attach replays. */
    std::mutex outputMutex;
    bool tornDown;
  };

  shared_ptr<SessionDirectory> directory;
  shared_ptr<ProcessExecutor> executor;
  shared_ptr<DeviceTransport> transport;
  shared_ptr<const NotificationConfig> notificationConfig;
  shared_ptr<const CompiledPatterns> compiledPatterns;
  TerminalManagerOptions options;
  InputRateLimiter rateLimiter;

  unordered_map<string, shared_ptr<SessionState>> sessions;
  std::mutex sessionsMutex;

  unordered_map<string, shared_ptr<DeviceOutbox>> outboxes;
  std::mutex outboxesMutex;

  std::unique_ptr<ThreadPool> sendPool;
  std::mutex poolMutex;

  shared_ptr<SessionState> getSession(const string& sessionId);
  shared_ptr<SessionState> getOrCreateSession(const string& sessionId);

  void sendEvent(const string& deviceId, const TerminalEvent& event);
  void enqueueEvent(const string& deviceId, const string& serializedEvent);
  void drainOutbox(shared_ptr<DeviceOutbox> outbox);
  void broadcastEvent(const string& serializedEvent);
  void notifyMatches(const string& sessionId,
                     const shared_ptr<SessionState>& session,
                     const vector<MatchResult>& matches);
};
}  // namespace ras

#endif  // __RAS_TERMINAL_MANAGER__
