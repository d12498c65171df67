#ifndef __RAS_ENGINE_CONFIG__
#define __RAS_ENGINE_CONFIG__

#include "Headers.hpp"
#include "NotificationConfig.hpp"
#include "SimpleIni.h"
#include "TerminalCommandRouter.hpp"
#include "TerminalManager.hpp"
#include "TmuxProcessExecutor.hpp"

namespace ras {
/**
 * @brief Daemon settings read from rasd.ini.
 *
 * Sections: [Terminal], [Notifications], [Tmux] and [Debug]. Keys that are
 * absent keep their defaults. A repeated `*_pattern` key replaces the
 * built-in list for that category.
 */
struct EngineConfig {
  TerminalManagerOptions terminal;
  int commandBudgetMs = TerminalCommandRouter::DEFAULT_BUDGET_MS;
  NotificationConfig notifications = NotificationConfig::defaults();
  TmuxConfig tmux;
  int verbose = 0;
  bool silent = false;
  string logSize = "20971520";

  /** @brief Reads an INI file. Returns false if it cannot be parsed. */
  bool loadFromFile(const string& path);

  bool loadFromString(const string& contents);

  /** @brief `<config home>/ras/rasd.ini` */
  static string defaultPath();

 protected:
  void apply(const CSimpleIniA& ini);
};
}  // namespace ras

#endif  // __RAS_ENGINE_CONFIG__
