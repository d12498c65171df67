#ifndef __RAS_FAKE_SESSION_DIRECTORY_HPP__
#define __RAS_FAKE_SESSION_DIRECTORY_HPP__

#include "SessionDirectory.hpp"

namespace ras {
class FakeSessionDirectory : public SessionDirectory {
 public:
  virtual optional<SessionInfo> lookup(const string& sessionId) {
    lock_guard<std::mutex> guard(directoryMutex);
    lookups++;
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
      return nullopt;
    }
    return it->second;
  }

  void add(const string& sessionId, const string& multiplexerName,
           SessionStatus status = SessionStatus::ACTIVE,
           optional<string> displayName = nullopt) {
    lock_guard<std::mutex> guard(directoryMutex);
    sessions[sessionId] = SessionInfo{multiplexerName, status, displayName};
  }

  void remove(const string& sessionId) {
    lock_guard<std::mutex> guard(directoryMutex);
    sessions.erase(sessionId);
  }

  int lookups = 0;

 protected:
  std::map<string, SessionInfo> sessions;
  std::mutex directoryMutex;
};
}  // namespace ras

#endif
