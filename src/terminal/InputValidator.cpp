#include "InputValidator.hpp"

namespace ras {
optional<ValidationError> InputValidator::validateSessionId(
    const string& sessionId) {
  if (sessionId.empty()) {
    return ValidationError{TerminalErrorCode::INVALID_SESSION_ID,
                           "Session ID is required"};
  }
  if (sessionId.find("..") != string::npos ||
      sessionId.find('/') != string::npos ||
      sessionId.find('\\') != string::npos ||
      sessionId.find('\0') != string::npos) {
    return ValidationError{TerminalErrorCode::INVALID_SESSION_ID,
                           "Invalid session ID format"};
  }
  if (sessionId.size() != size_t(SESSION_ID_LENGTH)) {
    return ValidationError{TerminalErrorCode::INVALID_SESSION_ID,
                           "Invalid session ID format"};
  }
  for (char c : sessionId) {
    // isalnum is locale dependent, stick to ASCII
    bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
              (c >= 'A' && c <= 'Z');
    if (!ok) {
      return ValidationError{TerminalErrorCode::INVALID_SESSION_ID,
                             "Invalid session ID format"};
    }
  }
  return nullopt;
}

optional<ValidationError> InputValidator::validateInputData(
    const string& data) {
  if (data.size() > MAX_INPUT_SIZE) {
    return ValidationError{TerminalErrorCode::INPUT_TOO_LARGE,
                           "Input exceeds maximum size of " +
                               std::to_string(MAX_INPUT_SIZE) + " bytes"};
  }
  return nullopt;
}

InputRateLimiter::InputRateLimiter(int _maxPerSecond)
    : InputRateLimiter(_maxPerSecond,
                       []() { return std::chrono::steady_clock::now(); }) {}

InputRateLimiter::InputRateLimiter(int _maxPerSecond, ClockFunction _clock)
    : maxPerSecond(_maxPerSecond), clock(_clock) {}

bool InputRateLimiter::tryAcquire(const string& sessionId) {
  lock_guard<std::mutex> guard(limiterMutex);
  auto now = clock();
  auto& window = windows[sessionId];
  while (!window.empty() && now - window.front() >= std::chrono::seconds(1)) {
    window.pop_front();
  }
  if (int(window.size()) >= maxPerSecond) {
    return false;
  }
  window.push_back(now);
  return true;
}

void InputRateLimiter::reset(const string& sessionId) {
  lock_guard<std::mutex> guard(limiterMutex);
  windows.erase(sessionId);
}
}  // namespace ras
