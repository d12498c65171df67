#include "NotificationConfig.hpp"

namespace ras {
const vector<string> ALT_SCREEN_ENTER_SEQUENCES = {"\x1b[?1049h",
                                                   "\x1b[?47h"};
const vector<string> ALT_SCREEN_EXIT_SEQUENCES = {"\x1b[?1049l", "\x1b[?47l"};

NotificationConfig NotificationConfig::defaults() {
  NotificationConfig config;
  config.approvalPatterns = defaultApprovalPatterns();
  config.errorPatterns = defaultErrorPatterns();
  config.shellPromptPatterns = defaultShellPromptPatterns();
  return config;
}

const vector<string>& NotificationConfig::defaultApprovalPatterns() {
  static const vector<string> patterns = {
      // yes/no prompts
      R"(\?\s*\(y/n\))",
      R"(\?\s*\[y/N\])",
      R"(\?\s*\[Y/n\])",
      R"(\?\s*\[yes/no\])",
      R"(\(yes/no\))",
      R"((?i)proceed\?)",
      R"((?i)continue\?)",
      R"((?i)approve\?)",
      R"((?i)confirm\?)",
      R"((?i)accept\?)",
      R"((?i)press enter)",
      R"((?i)press any key)",
      R"((?i)hit enter)",
      // coding agents
      R"((?i)do you want to proceed)",
      R"((?i)should I continue)",
      R"((?i)would you like to)",
  };
  return patterns;
}

const vector<string>& NotificationConfig::defaultErrorPatterns() {
  static const vector<string> patterns = {
      R"(^error:)",
      R"(^Error:)",
      R"(^ERROR:)",
      R"(^error\[)",
      R"((?i)^failed:)",
      R"((?i)^failure:)",
      R"((?i)exception:)",
      R"((?i)exception in)",
      R"(Traceback \(most recent call last\):)",
      R"((?i)stack trace:)",
      R"(^panic:)",
      R"(^fatal:)",
      R"(^FATAL:)",
      R"((?i)segmentation fault)",
      R"((?i)unhandled.*exception)",
      R"((?i)build failed)",
      R"((?i)compilation failed)",
      R"(npm ERR!)",
      R"((?i)cargo error)",
  };
  return patterns;
}

const vector<string>& NotificationConfig::defaultShellPromptPatterns() {
  static const vector<string> patterns = {
      R"(^\$ )",
      R"(^% )",
      R"(^> )",
      "^\xe2\x9d\xaf ",  // starship
      "^\xe2\x9e\x9c ",  // oh-my-zsh
      "^\xce\xbb ",
      R"(^\[\w+@\w+.*\]\$ )",
  };
  return patterns;
}
}  // namespace ras
