#include "EngineConfig.hpp"

namespace ras {
namespace {
vector<string> getAllValues(const CSimpleIniA& ini, const char* section,
                            const char* key) {
  CSimpleIniA::TNamesDepend values;
  vector<string> result;
  if (!ini.GetAllValues(section, key, values)) {
    return result;
  }
  values.sort(CSimpleIniA::Entry::LoadOrder());
  for (const auto& value : values) {
    result.push_back(value.pItem);
  }
  return result;
}

template <typename T>
void readPositive(const CSimpleIniA& ini, const char* section,
                  const char* key, T* value) {
  long parsed = ini.GetLongValue(section, key, -1);
  if (parsed > 0) {
    *value = T(parsed);
  } else if (ini.GetValue(section, key, NULL) != NULL) {
    LOG(WARNING) << "Ignoring invalid value for [" << section << "] " << key
                 << ": " << ini.GetValue(section, key, "");
  }
}
}  // namespace

bool EngineConfig::loadFromFile(const string& path) {
  CSimpleIniA ini(true, true, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(ERROR) << "Cannot load config file " << path << " (" << rc << ")";
    return false;
  }
  apply(ini);
  LOG(INFO) << "Loaded config from " << path;
  return true;
}

bool EngineConfig::loadFromString(const string& contents) {
  CSimpleIniA ini(true, true, false);
  SI_Error rc = ini.LoadData(contents);
  if (rc < 0) {
    LOG(ERROR) << "Cannot parse config (" << rc << ")";
    return false;
  }
  apply(ini);
  return true;
}

string EngineConfig::defaultPath() {
  return sago::getConfigHome() + "/ras/rasd.ini";
}

void EngineConfig::apply(const CSimpleIniA& ini) {
  size_t bufferSizeKb = terminal.bufferSize / 1024;
  readPositive(ini, "Terminal", "buffer_size_kb", &bufferSizeKb);
  terminal.bufferSize = bufferSizeKb * 1024;
  readPositive(ini, "Terminal", "max_pending_events",
               &terminal.maxPendingEvents);
  readPositive(ini, "Terminal", "send_threads", &terminal.sendThreads);
  readPositive(ini, "Terminal", "command_budget_ms", &commandBudgetMs);
  readPositive(ini, "Terminal", "rate_limit_per_second",
               &terminal.rateLimitPerSecond);

  terminal.notificationsEnabled = ini.GetBoolValue(
      "Notifications", "enabled", terminal.notificationsEnabled);
  double cooldown = ini.GetDoubleValue("Notifications", "cooldown_seconds",
                                       notifications.cooldownSeconds);
  if (cooldown >= 0.0) {
    notifications.cooldownSeconds = cooldown;
  }
  readPositive(ini, "Notifications", "regex_timeout_ms",
               &notifications.regexTimeoutMs);
  readPositive(ini, "Notifications", "sliding_window_size",
               &notifications.slidingWindowSize);
  readPositive(ini, "Notifications", "snippet_context_chars",
               &notifications.snippetContextChars);
  readPositive(ini, "Notifications", "max_snippet_length",
               &notifications.maxSnippetLength);

  auto approval = getAllValues(ini, "Notifications", "approval_pattern");
  if (!approval.empty()) {
    notifications.approvalPatterns = approval;
  }
  auto error = getAllValues(ini, "Notifications", "error_pattern");
  if (!error.empty()) {
    notifications.errorPatterns = error;
  }
  auto shellPrompt =
      getAllValues(ini, "Notifications", "shell_prompt_pattern");
  if (!shellPrompt.empty()) {
    notifications.shellPromptPatterns = shellPrompt;
  }

  const char* tmuxPath = ini.GetValue("Tmux", "path", NULL);
  if (tmuxPath && *tmuxPath) {
    tmux.path = tmuxPath;
  }
  const char* tmuxSocket = ini.GetValue("Tmux", "socket", NULL);
  if (tmuxSocket) {
    tmux.socket = tmuxSocket;
  }
  readPositive(ini, "Tmux", "chunk_interval_ms", &tmux.chunkIntervalMs);
  readPositive(ini, "Tmux", "max_chunk_size", &tmux.maxChunkSize);

  verbose = int(ini.GetLongValue("Debug", "verbose", verbose));
  silent = ini.GetBoolValue("Debug", "silent", silent);
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    logSize = string(logsize);
  }
}
}  // namespace ras
