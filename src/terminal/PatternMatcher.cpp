#include "PatternMatcher.hpp"

#include "AnsiStripper.hpp"

namespace ras {
namespace {
// Patterns see one line at a time: ^ and $ match at line breaks
const char MULTI_LINE_FLAG[] = "(?m)";
// A chunk that is only a prompt is shorter than this once trimmed
const size_t BARE_PROMPT_LENGTH = 20;

bool isWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f';
}

bool isUtf8Continuation(char c) { return (c & 0xC0) == 0x80; }

size_t trimmedLength(const string& text, size_t from) {
  size_t begin = from;
  size_t end = text.size();
  while (begin < end && isWhitespace(text[begin])) begin++;
  while (end > begin && isWhitespace(text[end - 1])) end--;
  return end - begin;
}

optional<size_t> lastOccurrence(const string& haystack,
                                const vector<string>& needles) {
  optional<size_t> last;
  for (const auto& needle : needles) {
    size_t pos = haystack.rfind(needle);
    if (pos != string::npos && (!last || pos > *last)) {
      last = pos;
    }
  }
  return last;
}

void compileList(const vector<string>& sources, bool alwaysIgnoreCase,
                 const string& listName, vector<CompiledPattern>* out) {
  for (const auto& source : sources) {
    RE2::Options options;
    options.set_log_errors(false);
    // A match never spans a line break, even through \s or [^x]
    options.set_never_nl(true);
    if (alwaysIgnoreCase) {
      options.set_case_sensitive(false);
    }
    auto regex =
        make_shared<const RE2>(string(MULTI_LINE_FLAG) + source, options);
    if (!regex->ok()) {
      LOG(ERROR) << "Disabling malformed " << listName << " pattern '"
                 << source << "': " << regex->error();
      continue;
    }
    out->push_back(CompiledPattern{source, regex});
  }
}
}  // namespace

shared_ptr<const CompiledPatterns> CompiledPatterns::compile(
    const NotificationConfig& config) {
  auto compiled = make_shared<CompiledPatterns>();
  compileList(config.approvalPatterns, true, "approval", &compiled->approval);
  compileList(config.errorPatterns, false, "error", &compiled->error);
  compileList(config.shellPromptPatterns, false, "shell prompt",
              &compiled->shellPrompt);
  VLOG(1) << "Compiled " << compiled->approval.size() << " approval, "
          << compiled->error.size() << " error, "
          << compiled->shellPrompt.size() << " shell prompt patterns";
  return compiled;
}

PatternMatcher::PatternMatcher(shared_ptr<const NotificationConfig> _config)
    : PatternMatcher(_config, CompiledPatterns::compile(*_config)) {}

PatternMatcher::PatternMatcher(shared_ptr<const NotificationConfig> _config,
                               shared_ptr<const CompiledPatterns> _patterns)
    : config(_config),
      patterns(_patterns),
      inAlternateScreen(false),
      lastWasPrompt(false) {}

vector<MatchResult> PatternMatcher::processChunk(const string& data) {
  vector<MatchResult> results;
  if (data.empty()) {
    return results;
  }
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(config->regexTimeoutMs);
  lock_guard<std::mutex> guard(matcherMutex);

  updateAlternateScreen(data);

  string combined = window + data;
  size_t rawBoundary = window.size();
  if (combined.size() > config->slidingWindowSize) {
    window = combined.substr(combined.size() - config->slidingWindowSize);
  } else {
    window = combined;
  }

  if (inAlternateScreen) {
    VLOG(2) << "Skipping pattern match while in alternate screen";
    return results;
  }

  size_t newTextStart = 0;
  string text = AnsiStripper::strip(combined, rawBoundary, &newTextStart);

  auto addResult = [&](NotificationCategory category,
                       const CompiledPattern& pattern, size_t start,
                       size_t end) {
    results.push_back(MatchResult{
        category, pattern.source,
        extractSnippet(text, start, end, config->snippetContextChars,
                       config->maxSnippetLength),
        start});
  };

  size_t matchStart, matchEnd;
  for (const auto& pattern : patterns->approval) {
    if (findNewMatch(pattern, text, newTextStart, deadline, &matchStart,
                     &matchEnd)) {
      addResult(NOTIFICATION_APPROVAL, pattern, matchStart, matchEnd);
    }
  }
  for (const auto& pattern : patterns->error) {
    if (findNewMatch(pattern, text, newTextStart, deadline, &matchStart,
                     &matchEnd)) {
      addResult(NOTIFICATION_ERROR, pattern, matchStart, matchEnd);
    }
  }

  bool promptFound = false;
  for (const auto& pattern : patterns->shellPrompt) {
    if (findNewMatch(pattern, text, newTextStart, deadline, &matchStart,
                     &matchEnd)) {
      promptFound = true;
      // A prompt right after another bare prompt is just the user hitting
      // enter, not a command finishing.
      if (!lastWasPrompt) {
        addResult(NOTIFICATION_SHELL_IDLE, pattern, matchStart, matchEnd);
      }
      break;
    }
  }
  lastWasPrompt =
      promptFound && trimmedLength(text, newTextStart) < BARE_PROMPT_LENGTH;

  if (!results.empty()) {
    VLOG(1) << "Found " << results.size() << " matches in chunk";
  }
  return results;
}

void PatternMatcher::reset() {
  lock_guard<std::mutex> guard(matcherMutex);
  window.clear();
  inAlternateScreen = false;
  lastWasPrompt = false;
}

bool PatternMatcher::isInAlternateScreen() const {
  lock_guard<std::mutex> guard(matcherMutex);
  return inAlternateScreen;
}

void PatternMatcher::updateAlternateScreen(const string& data) {
  // Re-scan the end of the previous window so a sequence split across
  // chunks is still seen.
  size_t longest = 0;
  for (const auto& seq : ALT_SCREEN_ENTER_SEQUENCES) {
    longest = max(longest, seq.size());
  }
  for (const auto& seq : ALT_SCREEN_EXIT_SEQUENCES) {
    longest = max(longest, seq.size());
  }
  size_t tailLength = min(window.size(), longest - 1);
  string scan = window.substr(window.size() - tailLength) + data;

  optional<size_t> lastEnter = lastOccurrence(scan, ALT_SCREEN_ENTER_SEQUENCES);
  optional<size_t> lastExit = lastOccurrence(scan, ALT_SCREEN_EXIT_SEQUENCES);
  if (!lastEnter && !lastExit) {
    return;
  }
  bool entered = lastEnter && (!lastExit || *lastEnter > *lastExit);
  if (entered != inAlternateScreen) {
    VLOG(1) << (entered ? "Entering" : "Leaving") << " alternate screen";
  }
  inAlternateScreen = entered;
}

bool PatternMatcher::findNewMatch(
    const CompiledPattern& pattern, const string& text, size_t newTextStart,
    std::chrono::steady_clock::time_point deadline, size_t* matchStart,
    size_t* matchEnd) const {
  // Lines that end before the new text were scanned with an earlier chunk
  size_t position = 0;
  if (newTextStart > 0) {
    size_t previousBreak = text.rfind('\n', newTextStart - 1);
    if (previousBreak != string::npos) {
      position = previousBreak + 1;
    }
  }

  re2::StringPiece input(text);
  re2::StringPiece match;
  while (position <= text.size()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      VLOG(1) << "Pattern '" << pattern.source << "' skipped, scan ran over "
              << config->regexTimeoutMs << "ms";
      return false;
    }
    if (!pattern.regex->Match(input, position, text.size(), RE2::UNANCHORED,
                              &match, 1)) {
      return false;
    }
    size_t start = match.data() - text.data();
    size_t end = start + match.size();
    if (end > start && end > newTextStart) {
      *matchStart = start;
      *matchEnd = end;
      return true;
    }
    position = end > start ? end : start + 1;
  }
  return false;
}

string PatternMatcher::extractSnippet(const string& text, size_t matchStart,
                                      size_t matchEnd, size_t contextChars,
                                      size_t maxLength) {
  size_t start = matchStart > contextChars ? matchStart - contextChars : 0;
  size_t end = min(text.size(), matchEnd + contextChars);
  while (start > 0 && isUtf8Continuation(text[start])) start--;
  while (end < text.size() && isUtf8Continuation(text[end])) end++;

  string body;
  bool pendingSpace = false;
  for (size_t i = start; i < end; i++) {
    if (isWhitespace(text[i])) {
      pendingSpace = !body.empty();
      continue;
    }
    if (pendingSpace) {
      body.push_back(' ');
      pendingSpace = false;
    }
    body.push_back(text[i]);
  }

  string snippet = body;
  if (start > 0) {
    snippet = "..." + snippet;
  }
  if (end < text.size()) {
    snippet += "...";
  }
  if (snippet.size() > maxLength) {
    size_t cut = maxLength > 3 ? maxLength - 3 : 0;
    while (cut > 0 && isUtf8Continuation(snippet[cut])) cut--;
    snippet = snippet.substr(0, cut) + "...";
  }
  return snippet;
}
}  // namespace ras
