#include "SessionRegistry.hpp"

#include "InputValidator.hpp"

namespace ras {
SessionRegistry::SessionRegistry() {
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
}

optional<SessionInfo> SessionRegistry::lookup(const string& sessionId) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return nullopt;
  }
  return it->second;
}

string SessionRegistry::createSession(const string& multiplexerName,
                                      const optional<string>& displayName) {
  lock_guard<std::mutex> guard(registryMutex);
  string sessionId;
  do {
    sessionId = genRandomAlphaNum(SESSION_ID_LENGTH);
  } while (sessions.count(sessionId));
  sessions[sessionId] =
      SessionInfo{multiplexerName, SessionStatus::ACTIVE, displayName};
  LOG(INFO) << "Registered tmux session " << multiplexerName << " as "
            << sessionId;
  return sessionId;
}

bool SessionRegistry::registerSession(const string& sessionId,
                                      const SessionInfo& info) {
  if (InputValidator::validateSessionId(sessionId)) {
    LOG(ERROR) << "Refusing to register malformed session id " << sessionId;
    return false;
  }
  lock_guard<std::mutex> guard(registryMutex);
  if (!sessions.insert(std::make_pair(sessionId, info)).second) {
    LOG(ERROR) << "Session " << sessionId << " is already registered";
    return false;
  }
  return true;
}

bool SessionRegistry::setStatus(const string& sessionId,
                                SessionStatus status) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return false;
  }
  it->second.status = status;
  return true;
}

bool SessionRegistry::removeSession(const string& sessionId) {
  lock_guard<std::mutex> guard(registryMutex);
  return sessions.erase(sessionId) > 0;
}

vector<pair<string, SessionInfo>> SessionRegistry::listSessions() {
  lock_guard<std::mutex> guard(registryMutex);
  return vector<pair<string, SessionInfo>>(sessions.begin(), sessions.end());
}
}  // namespace ras
