#ifndef __RAS_INPUT_VALIDATOR__
#define __RAS_INPUT_VALIDATOR__

#include "Headers.hpp"

namespace ras {
/** @brief Error codes carried by `TerminalError` events. */
namespace TerminalErrorCode {
static const char INVALID_SESSION_ID[] = "INVALID_SESSION_ID";
static const char INPUT_TOO_LARGE[] = "INPUT_TOO_LARGE";
static const char RATE_LIMITED[] = "RATE_LIMITED";
static const char PIPE_ERROR[] = "PIPE_ERROR";
static const char NOT_ATTACHED[] = "NOT_ATTACHED";
static const char SESSION_NOT_FOUND[] = "SESSION_NOT_FOUND";
static const char SESSION_KILLING[] = "SESSION_KILLING";
static const char RESIZE_FAILED[] = "RESIZE_FAILED";
}  // namespace TerminalErrorCode

struct ValidationError {
  string code;
  string message;
};

/**
 * @brief Stateless checks applied to device requests before they reach tmux.
 */
class InputValidator {
 public:
  /**
   * @brief Session ids are exactly SESSION_ID_LENGTH ASCII alphanumerics.
   * @return nullopt when valid.
   */
  static optional<ValidationError> validateSessionId(const string& sessionId);

  /**
   * @brief Rejects payloads larger than MAX_INPUT_SIZE.
   * @return nullopt when valid.
   */
  static optional<ValidationError> validateInputData(const string& data);
};

/**
 * @brief Sliding one second window limiting input messages per session.
 */
class InputRateLimiter {
 public:
  typedef std::function<std::chrono::steady_clock::time_point()> ClockFunction;

  explicit InputRateLimiter(int _maxPerSecond = RATE_LIMIT_PER_SECOND);
  InputRateLimiter(int _maxPerSecond, ClockFunction _clock);

  /**
   * @brief Records an input for `sessionId`.
   * @return false if the session already used its budget for the current
   * window. Rejected inputs are not recorded.
   */
  bool tryAcquire(const string& sessionId);

  void reset(const string& sessionId);

 protected:
  int maxPerSecond;
  ClockFunction clock;
  unordered_map<string, std::deque<std::chrono::steady_clock::time_point>>
      windows;
  std::mutex limiterMutex;
};
}  // namespace ras

#endif  // __RAS_INPUT_VALIDATOR__
