#include <cxxopts.hpp>

#include "ConsoleTransport.hpp"
#include "EngineConfig.hpp"
#include "LogHandler.hpp"
#include "PipePaneCapture.hpp"
#include "SessionRegistry.hpp"
#include "TerminalCommandRouter.hpp"
#include "TerminalManager.hpp"
#include "TmuxProcessExecutor.hpp"

using namespace ras;

namespace {
const char CONSOLE_DEVICE_ID[] = "console";

void attachConsole(TerminalCommandRouter* router, const string& sessionId) {
  TerminalCommand command;
  command.mutable_attach()->set_session_id(sessionId);
  if (!router->dispatch(CONSOLE_DEVICE_ID, protoToString(command))) {
    LOG(ERROR) << "Could not attach console to " << sessionId;
  }
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ras::HandleTerminate();

  // Signals are collected with sigwait on the main thread, so block them
  // before any worker thread is started.
  sigset_t shutdownSignals;
  sigemptyset(&shutdownSignals);
  sigaddset(&shutdownSignals, SIGINT);
  sigaddset(&shutdownSignals, SIGTERM);
  int rc = pthread_sigmask(SIG_BLOCK, &shutdownSignals, NULL);
  if (rc != 0) {
    STFATAL << "Cannot block shutdown signals: " << strerror(rc);
  }

  cxxopts::Options options("rasd", "Remote access to local terminal sessions");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("watch", "tmux session to serve (repeatable)",
         cxxopts::value<vector<string>>(), "SESSION")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "rasd version " << RAS_VERSION << endl;
      exit(0);
    }

    EngineConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      if (!config.loadFromFile(cfgfilename)) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
    } else if (fs::exists(EngineConfig::defaultPath())) {
      if (!config.loadFromFile(EngineConfig::defaultPath())) {
        STFATAL << "Invalid config file: " << EngineConfig::defaultPath();
      }
    }

    // prioritize command line option over cfgfile
    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else {
      el::Loggers::setVerboseLevel(config.verbose);
    }
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    LogHandler::setupLogFiles(&defaultConf, GetTempDirectory() + "ras",
                              "rasd", result.count("logtostdout") > 0,
                              config.logSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("rasd-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    auto registry = make_shared<SessionRegistry>();
    auto subprocess = make_shared<SubprocessUtils>();
    auto executor = make_shared<TmuxProcessExecutor>(subprocess, config.tmux);
    auto transport = make_shared<ConsoleTransport>();
    auto notificationConfig =
        make_shared<const NotificationConfig>(config.notifications);
    auto manager = make_shared<TerminalManager>(
        registry, executor, transport, notificationConfig, config.terminal);
    TerminalCommandRouter router(
        manager, TerminalCommandRouter::DEFAULT_HANDLER_THREADS,
        std::chrono::milliseconds(config.commandBudgetMs));

    vector<shared_ptr<PipePaneCapture>> captures;
    if (result.count("watch")) {
      for (const auto &tmuxName : result["watch"].as<vector<string>>()) {
        string sessionId = registry->createSession(tmuxName, tmuxName);
        auto capture = make_shared<PipePaneCapture>(
            subprocess, sessionId, tmuxName,
            [manager](const string &id, const string &data) {
              manager->onOutput(id, data);
            },
            config.tmux);
        try {
          capture->start();
        } catch (const std::runtime_error &re) {
          LOG(ERROR) << "Cannot capture " << tmuxName << ": " << re.what();
          registry->removeSession(sessionId);
          continue;
        }
        captures.push_back(capture);
        attachConsole(&router, sessionId);
        CLOG(INFO, "stdout") << "Watching " << tmuxName << " as " << sessionId
                             << endl;
      }
    }
    if (captures.empty()) {
      CLOG(INFO, "stdout") << "No tmux sessions to watch, use --watch" << endl;
    }

    int receivedSignal = 0;
    sigwait(&shutdownSignals, &receivedSignal);
    LOG(INFO) << "Got signal " << receivedSignal << ", shutting down";

    for (const auto &capture : captures) {
      capture->stop();
    }
    router.shutdown();
    for (const auto &session : registry->listSessions()) {
      manager->onSessionKilled(session.first);
    }
    manager->shutdown();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
