#ifndef __RAS_SESSION_DIRECTORY_HPP__
#define __RAS_SESSION_DIRECTORY_HPP__

#include "Headers.hpp"

namespace ras {
enum class SessionStatus { CREATING, ACTIVE, KILLING };

/**
 * @brief What the terminal engine needs to know about a session.
 */
struct SessionInfo {
  /** @brief Name of the backing tmux session. */
  string multiplexerName;
  SessionStatus status;
  optional<string> displayName;
};

/**
 * @brief Resolves session ids to their tmux backing. Sessions are created
 * and killed elsewhere; the engine only looks them up.
 */
class SessionDirectory {
 public:
  virtual ~SessionDirectory() {}

  /** @brief Returns nullopt when no session has this id. */
  virtual optional<SessionInfo> lookup(const string& sessionId) = 0;
};
}  // namespace ras

#endif
