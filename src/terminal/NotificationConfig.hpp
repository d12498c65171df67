#ifndef __RAS_NOTIFICATION_CONFIG__
#define __RAS_NOTIFICATION_CONFIG__

#include "Headers.hpp"

namespace ras {
/**
 * @brief Settings for output pattern detection and notification cooldowns.
 *
 * Built once at startup and shared read-only by every session.
 */
struct NotificationConfig {
  vector<string> approvalPatterns;
  vector<string> errorPatterns;
  vector<string> shellPromptPatterns;

  /** @brief Minimum time between notifications of one category. */
  double cooldownSeconds = 5.0;
  /** @brief Wall clock budget for evaluating one pattern against a chunk. */
  int regexTimeoutMs = 100;
  /** @brief Raw bytes carried over from the previous chunk. */
  size_t slidingWindowSize = 500;
  size_t snippetContextChars = 25;
  size_t maxSnippetLength = 60;

  /** @brief A config holding the built-in pattern lists. */
  static NotificationConfig defaults();

  static const vector<string>& defaultApprovalPatterns();
  static const vector<string>& defaultErrorPatterns();
  static const vector<string>& defaultShellPromptPatterns();
};

/** @brief Raw sequences that switch a terminal to the alternate screen. */
extern const vector<string> ALT_SCREEN_ENTER_SEQUENCES;
/** @brief Raw sequences that switch back to the normal screen. */
extern const vector<string> ALT_SCREEN_EXIT_SEQUENCES;
}  // namespace ras

#endif  // __RAS_NOTIFICATION_CONFIG__
