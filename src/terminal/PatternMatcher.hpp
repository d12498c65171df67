#ifndef __RAS_PATTERN_MATCHER__
#define __RAS_PATTERN_MATCHER__

#include "Headers.hpp"
#include "NotificationConfig.hpp"

namespace ras {
/**
 * @brief A pattern found in a session's output.
 */
struct MatchResult {
  NotificationCategory category;
  /** @brief Source text of the pattern that matched. */
  string pattern;
  /** @brief Short single line excerpt around the match. */
  string snippet;
  /** @brief Offset of the match in the cleaned scan window. */
  size_t position;
};

struct CompiledPattern {
  string source;
  shared_ptr<const RE2> regex;
};

/**
 * @brief The pattern lists of a NotificationConfig, compiled once and
 * shared by every session's matcher.
 */
struct CompiledPatterns {
  vector<CompiledPattern> approval;
  vector<CompiledPattern> error;
  vector<CompiledPattern> shellPrompt;

  /**
   * @brief Compiles every pattern in `config`. Patterns that fail to compile
   * are logged and left out.
   */
  static shared_ptr<const CompiledPatterns> compile(
      const NotificationConfig& config);

  size_t size() const {
    return approval.size() + error.size() + shellPrompt.size();
  }
};

/**
 * @brief Incremental scanner that looks for approval prompts, errors and
 * shell prompts in a session's output.
 *
 * Patterns run on RE2, so each search is linear in the text, and one
 * deadline of `regexTimeoutMs` covers the whole scan of a chunk. Patterns
 * not evaluated in time count as non-matching.
 *
 * The tail of the previous chunk is kept so a pattern split across two
 * deliveries is still found. Only matches ending in the new chunk are
 * reported, so text is never reported twice. Matching pauses while a full
 * screen program (vim, less, htop) has the terminal on the alternate
 * screen.
 */
class PatternMatcher {
 public:
  explicit PatternMatcher(shared_ptr<const NotificationConfig> _config);
  PatternMatcher(shared_ptr<const NotificationConfig> _config,
                 shared_ptr<const CompiledPatterns> _patterns);

  /**
   * @brief Scans `data` together with the carried over window.
   * @return Every match, approval first, then error, then shell idle.
   */
  vector<MatchResult> processChunk(const string& data);

  /** @brief Forgets the window and the screen/prompt tracking state. */
  void reset();

  bool isInAlternateScreen() const;

  /** @brief Builds the notification excerpt for a match in `text`. */
  static string extractSnippet(const string& text, size_t matchStart,
                               size_t matchEnd, size_t contextChars,
                               size_t maxLength);

 protected:
  shared_ptr<const NotificationConfig> config;
  shared_ptr<const CompiledPatterns> patterns;
  string window;
  bool inAlternateScreen;
  bool lastWasPrompt;
  mutable std::mutex matcherMutex;

  void updateAlternateScreen(const string& data);

  /**
   * @brief Finds the first match of `pattern` in `text` that ends after
   * `newTextStart`. Gives up once `deadline` has passed.
   */
  bool findNewMatch(const CompiledPattern& pattern, const string& text,
                    size_t newTextStart,
                    std::chrono::steady_clock::time_point deadline,
                    size_t* matchStart, size_t* matchEnd) const;
};
}  // namespace ras

#endif  // __RAS_PATTERN_MATCHER__
