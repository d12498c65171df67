#ifndef __RAS_SESSION_REGISTRY__
#define __RAS_SESSION_REGISTRY__

#include "Headers.hpp"
#include "SessionDirectory.hpp"

namespace ras {
/**
 * @brief In-memory, thread-safe table of the sessions the daemon serves.
 */
class SessionRegistry : public SessionDirectory {
 public:
  SessionRegistry();
  virtual ~SessionRegistry() {}

  virtual optional<SessionInfo> lookup(const string& sessionId);

  /**
   * @brief Registers a tmux session under a fresh random id.
   * @return The new session id.
   */
  string createSession(const string& multiplexerName,
                       const optional<string>& displayName);

  /**
   * @brief Registers a session under a caller supplied id.
   * @return false if the id is malformed or already taken.
   */
  bool registerSession(const string& sessionId, const SessionInfo& info);

  bool setStatus(const string& sessionId, SessionStatus status);

  bool removeSession(const string& sessionId);

  vector<pair<string, SessionInfo>> listSessions();

 protected:
  std::map<string, SessionInfo> sessions;
  std::mutex registryMutex;
};
}  // namespace ras

#endif  // __RAS_SESSION_REGISTRY__
