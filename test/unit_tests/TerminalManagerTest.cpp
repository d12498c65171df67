#include "FakeDeviceTransport.hpp"
#include "FakeProcessExecutor.hpp"
#include "FakeSessionDirectory.hpp"
#include "TerminalManager.hpp"
#include "TestHeaders.hpp"

using namespace ras;

namespace {
const string SESSION_ID = "abcDEF012345";
const string OTHER_SESSION_ID = "zyxWVU987654";
const string TMUX_NAME = "ras-main";

struct ManagerHarness {
  explicit ManagerHarness(
      const TerminalManagerOptions& options = TerminalManagerOptions())
      : directory(new FakeSessionDirectory()),
        executor(new FakeProcessExecutor()),
        transport(new FakeDeviceTransport()) {
    directory->add(SESSION_ID, TMUX_NAME, SessionStatus::ACTIVE,
                   string("My Agent"));
    manager.reset(new TerminalManager(
        directory, executor, transport,
        make_shared<const NotificationConfig>(NotificationConfig::defaults()),
        options));
  }

  TerminalInput dataInput(const string& data,
                          const string& sessionId = SESSION_ID) {
    TerminalInput input;
    input.set_session_id(sessionId);
    input.set_data(data);
    return input;
  }

  // Waits for `count` events and returns them
  vector<TerminalEvent> events(const string& deviceId, size_t count) {
    REQUIRE(transport->waitForEvents(deviceId, count));
    return transport->getEvents(deviceId);
  }

  shared_ptr<FakeSessionDirectory> directory;
  shared_ptr<FakeProcessExecutor> executor;
  shared_ptr<FakeDeviceTransport> transport;
  shared_ptr<TerminalManager> manager;
};

void requireError(const TerminalEvent& event, const string& code) {
  REQUIRE(event.has_error());
  REQUIRE(event.error().code() == code);
}
}  // namespace

TEST_CASE("Attach then receive live output", "[TerminalManager]") {
  ManagerHarness harness;
  harness.manager->attach("phone", SESSION_ID, nullopt);
  harness.manager->onOutput(SESSION_ID, "hello");
  harness.manager->onOutput(SESSION_ID, " world");

  auto events = harness.events("phone", 3);
  REQUIRE(events[0].has_attached());
  REQUIRE(events[0].attached().session_id() == SESSION_ID);
  REQUIRE(events[0].attached().buffer_start_sequence() == 0);
  REQUIRE(events[0].attached().current_sequence() == 0);

  REQUIRE(events[1].has_output());
  REQUIRE(events[1].output().sequence() == 0);
  REQUIRE(events[1].output().data() == "hello");
  REQUIRE(events[2].output().sequence() == 1);
  REQUIRE(events[2].output().data() == " world");

  REQUIRE(harness.manager->isSessionAttached(SESSION_ID));
  REQUIRE(harness.manager->getAttachedSession("phone") == SESSION_ID);
}

TEST_CASE("Reconnect replays missed output", "[TerminalManager]") {
  ManagerHarness harness;
  harness.manager->onOutput(SESSION_ID, "one");
  harness.manager->onOutput(SESSION_ID, "two");
  harness.manager->onOutput(SESSION_ID, "three");

  harness.manager->attach("phone", SESSION_ID, 0);
  auto events = harness.events("phone", 3);
  REQUIRE(events[0].attached().buffer_start_sequence() == 0);
  REQUIRE(events[0].attached().current_sequence() == 3);
  REQUIRE(events[1].output().sequence() == 1);
  REQUIRE(events[1].output().data() == "two");
  REQUIRE(events[2].output().sequence() == 2);
  REQUIRE(events[2].output().data() == "three");

  harness.manager->shutdown();
  REQUIRE(harness.transport->getEvents("phone").size() == 3);
}

TEST_CASE("Reconnect after eviction reports skipped output",
          "[TerminalManager]") {
  TerminalManagerOptions options;
  options.bufferSize = 10;
  ManagerHarness harness(options);
  harness.manager->onOutput(SESSION_ID, "aaaa");
  harness.manager->onOutput(SESSION_ID, "bbbb");
  harness.manager->onOutput(SESSION_ID, "cccc");
  harness.manager->onOutput(SESSION_ID, "dddd");

  harness.manager->attach("phone", SESSION_ID, 0);
  auto events = harness.events("phone", 4);
  REQUIRE(events[0].attached().buffer_start_sequence() == 2);
  REQUIRE(events[0].attached().current_sequence() == 4);

  REQUIRE(events[1].has_skipped());
  REQUIRE(events[1].skipped().session_id() == SESSION_ID);
  REQUIRE(events[1].skipped().from_sequence() == 1);
  REQUIRE(events[1].skipped().to_sequence() == 1);

  REQUIRE(events[2].output().sequence() == 2);
  REQUIRE(events[2].output().data() == "cccc");
  REQUIRE(events[3].output().sequence() == 3);
  REQUIRE(events[3].output().data() == "dddd");
}

TEST_CASE("Reconnect when caught up replays nothing", "[TerminalManager]") {
  ManagerHarness harness;
  harness.manager->onOutput(SESSION_ID, "one");
  harness.manager->attach("phone", SESSION_ID, 0);
  harness.manager->onOutput(SESSION_ID, "two");

  auto events = harness.events("phone", 2);
  REQUIRE(events[0].has_attached());
  REQUIRE(events[1].output().sequence() == 1);
  harness.manager->shutdown();
  REQUIRE(harness.transport->getEvents("phone").size() == 2);
}

TEST_CASE("Reconnect with a sequence beyond the stream replays nothing",
          "[TerminalManager]") {
  ManagerHarness harness;
  harness.manager->onOutput(SESSION_ID, "one");
  harness.manager->onOutput(SESSION_ID, "two");
  harness.manager->attach("phone", SESSION_ID,
                          std::numeric_limits<uint64_t>::max());
  harness.manager->attach("tablet", SESSION_ID, 7);
  harness.manager->shutdown();

  auto phoneEvents = harness.transport->getEvents("phone");
  REQUIRE(phoneEvents.size() == 1);
  REQUIRE(phoneEvents[0].has_attached());
  REQUIRE(phoneEvents[0].attached().current_sequence() == 2);
  REQUIRE(harness.transport->getEvents("tablet").size() == 1);
}

TEST_CASE("Attaching during live output neither repeats nor loses chunks",
          "[TerminalManager]") {
  const int CHUNKS = 400;
  const int DEVICES = 16;
  TerminalManagerOptions options;
  options.maxPendingEvents = CHUNKS * 4;
  ManagerHarness harness(options);
  harness.manager->onOutput(SESSION_ID, "chunk 0\n");

  std::thread output([&]() {
    for (int i = 1; i < CHUNKS; i++) {
      harness.manager->onOutput(SESSION_ID, "chunk " + to_string(i) + "\n");
    }
  });
  for (int d = 0; d < DEVICES; d++) {
    harness.manager->attach("device" + to_string(d), SESSION_ID, 0);
    std::this_thread::yield();
  }
  output.join();
  harness.manager->shutdown();

  for (int d = 0; d < DEVICES; d++) {
    string deviceId = "device" + to_string(d);
    auto events = harness.transport->getEvents(deviceId);
    REQUIRE(!events.empty());
    REQUIRE(events[0].has_attached());

    // Everything after the last seen chunk 0 arrives once, in order
    uint64_t expected = 1;
    for (size_t i = 1; i < events.size(); i++) {
      REQUIRE(events[i].has_output());
      REQUIRE(events[i].output().sequence() == expected);
      expected++;
    }
    REQUIRE(expected == uint64_t(CHUNKS));
  }
}

TEST_CASE("Output fans out to every attached device", "[TerminalManager]") {
  ManagerHarness harness;
  harness.manager->attach("phone", SESSION_ID, nullopt);
  harness.manager->attach("tablet", SESSION_ID, nullopt);
  REQUIRE(harness.manager->getAttachmentCount(SESSION_ID) == 2);

  for (int i = 0; i < 20; i++) {
    harness.manager->onOutput(SESSION_ID, "line " + to_string(i) + "\n");
  }

  for (const string& device : {string("phone"), string("tablet")}) {
    auto events = harness.events(device, 21);
    for (int i = 0; i < 20; i++) {
      REQUIRE(events[i + 1].output().sequence() == uint64_t(i));
      REQUIRE(events[i + 1].output().data() == "line " + to_string(i) + "\n");
    }
  }
}

TEST_CASE("Detached devices stop receiving output", "[TerminalManager]") {
  ManagerHarness harness;
  harness.manager->attach("phone", SESSION_ID, nullopt);
  harness.manager->attach("tablet", SESSION_ID, nullopt);
  harness.manager->detach("phone", SESSION_ID);

  auto phoneEvents = harness.events("phone", 2);
  REQUIRE(phoneEvents[1].has_detached());
  REQUIRE(phoneEvents[1].detached().reason() == "user_request");

  harness.manager->onOutput(SESSION_ID, "after");
  harness.events("tablet", 2);
  harness.manager->shutdown();
  REQUIRE(harness.transport->getEvents("phone").size() == 2);
}

TEST_CASE("Attach validates the session", "[TerminalManager]") {
  ManagerHarness harness;
  harness.directory->add(OTHER_SESSION_ID, "other", SessionStatus::KILLING);

  harness.manager->attach("phone", "../etc/passwd", nullopt);
  harness.manager->attach("phone", "", nullopt);
  harness.manager->attach("phone", "nOsUcHsEsSiOn", nullopt);
  harness.manager->attach("phone", "nOsUcHsEsSi1", nullopt);
  harness.manager->attach("phone", OTHER_SESSION_ID, nullopt);

  auto events = harness.events("phone", 5);
  requireError(events[0], TerminalErrorCode::INVALID_SESSION_ID);
  REQUIRE(events[0].error().message() == "Invalid session ID format");
  requireError(events[1], TerminalErrorCode::INVALID_SESSION_ID);
  REQUIRE(events[1].error().message() == "Session ID is required");
  requireError(events[2], TerminalErrorCode::INVALID_SESSION_ID);
  requireError(events[3], TerminalErrorCode::SESSION_NOT_FOUND);
  requireError(events[4], TerminalErrorCode::SESSION_KILLING);
  REQUIRE(events[4].error().session_id() == OTHER_SESSION_ID);

  REQUIRE(!harness.manager->hasSession(OTHER_SESSION_ID));
  REQUIRE(!harness.manager->getAttachedSession("phone"));
}

TEST_CASE("Input reaches tmux", "[TerminalManager]") {
  ManagerHarness harness;
  harness.manager->attach("phone", SESSION_ID, nullopt);
  harness.manager->handleInput("phone", harness.dataInput("ls -la\r"));

  TerminalInput special;
  special.set_session_id(SESSION_ID);
  special.mutable_special()->set_key(KEY_UP);
  special.mutable_special()->set_modifiers(4);
  harness.manager->handleInput("phone", special);

  auto sent = harness.executor->getSentKeys();
  REQUIRE(sent.size() == 2);
  REQUIRE(sent[0].first == TMUX_NAME);
  REQUIRE(sent[0].second == "ls -la\r");
  REQUIRE(sent[1].second == "\x1b[1;5A");

  harness.manager->shutdown();
  // Only the attach confirmation
  REQUIRE(harness.transport->getEvents("phone").size() == 1);
}

TEST_CASE("Input is rejected with a specific error", "[TerminalManager]") {
  ManagerHarness harness;

  SECTION("not attached") {
    harness.manager->handleInput("phone", harness.dataInput("x"));
    auto events = harness.events("phone", 1);
    requireError(events[0], TerminalErrorCode::NOT_ATTACHED);
  }

  SECTION("bad session id") {
    harness.manager->handleInput("phone", harness.dataInput("x", "bad/id"));
    auto events = harness.events("phone", 1);
    requireError(events[0], TerminalErrorCode::INVALID_SESSION_ID);
  }

  SECTION("too large") {
    harness.manager->attach("phone", SESSION_ID, nullopt);
    harness.manager->handleInput(
        "phone", harness.dataInput(string(MAX_INPUT_SIZE + 1, 'x')));
    auto events = harness.events("phone", 2);
    requireError(events[1], TerminalErrorCode::INPUT_TOO_LARGE);
  }

  SECTION("tmux rejects the keys") {
    harness.manager->attach("phone", SESSION_ID, nullopt);
    harness.executor->failSendKeys = true;
    harness.manager->handleInput("phone", harness.dataInput("x"));
    auto events = harness.events("phone", 2);
    requireError(events[1], TerminalErrorCode::PIPE_ERROR);
  }

  SECTION("tmux throws") {
    harness.manager->attach("phone", SESSION_ID, nullopt);
    harness.executor->throwOnSendKeys = true;
    harness.manager->handleInput("phone", harness.dataInput("x"));
    auto events = harness.events("phone", 2);
    requireError(events[1], TerminalErrorCode::PIPE_ERROR);
  }

  SECTION("session vanished") {
    harness.manager->attach("phone", SESSION_ID, nullopt);
    harness.directory->remove(SESSION_ID);
    harness.manager->handleInput("phone", harness.dataInput("x"));
    auto events = harness.events("phone", 2);
    requireError(events[1], TerminalErrorCode::SESSION_NOT_FOUND);
  }

  REQUIRE(harness.executor->getSentKeys().empty());
}

TEST_CASE("Unknown special keys are ignored", "[TerminalManager]") {
  ManagerHarness harness;
  harness.manager->attach("phone", SESSION_ID, nullopt);

  TerminalInput special;
  special.set_session_id(SESSION_ID);
  special.mutable_special()->set_key(KEY_UNKNOWN);
  harness.manager->handleInput("phone", special);

  harness.manager->shutdown();
  REQUIRE(harness.executor->getSentKeys().empty());
  REQUIRE(harness.transport->getEvents("phone").size() == 1);
}

TEST_CASE("Input is rate limited per session", "[TerminalManager]") {
  TerminalManagerOptions options;
  options.rateLimitPerSecond = 2;
  ManagerHarness harness(options);
  harness.manager->attach("phone", SESSION_ID, nullopt);

  for (int i = 0; i < 3; i++) {
    harness.manager->handleInput("phone", harness.dataInput("k"));
  }
  auto events = harness.events("phone", 2);
  requireError(events[1], TerminalErrorCode::RATE_LIMITED);
  REQUIRE(harness.executor->getSentKeys().size() == 2);
}

TEST_CASE("Killed sessions detach everyone", "[TerminalManager]") {
  ManagerHarness harness;
  harness.manager->attach("phone", SESSION_ID, nullopt);
  harness.manager->attach("tablet", SESSION_ID, nullopt);
  harness.manager->onOutput(SESSION_ID, "bye");

  harness.manager->onSessionKilled(SESSION_ID);
  REQUIRE(!harness.manager->hasSession(SESSION_ID));
  REQUIRE(harness.manager->getAttachmentCount(SESSION_ID) == 0);

  for (const string& device : {string("phone"), string("tablet")}) {
    auto events = harness.events(device, 3);
    REQUIRE(events[2].has_detached());
    REQUIRE(events[2].detached().session_id() == SESSION_ID);
    REQUIRE(events[2].detached().reason() == "session_killed");
  }

  // Killing twice is harmless
  harness.manager->onSessionKilled(SESSION_ID);

  // A session that comes back starts with an empty history
  harness.manager->onOutput(SESSION_ID, "again");
  harness.manager->attach("phone", SESSION_ID, nullopt);
  auto events = harness.events("phone", 4);
  REQUIRE(events[3].attached().buffer_start_sequence() == 0);
  REQUIRE(events[3].attached().current_sequence() == 1);
}

TEST_CASE("Output for unknown or dying sessions is dropped",
          "[TerminalManager]") {
  ManagerHarness harness;
  harness.directory->add(OTHER_SESSION_ID, "other", SessionStatus::KILLING);
  harness.manager->onOutput("nOsUcHsEsSi1", "x");
  harness.manager->onOutput(OTHER_SESSION_ID, "x");
  harness.manager->onOutput(SESSION_ID, "");
  REQUIRE(!harness.manager->hasSession("nOsUcHsEsSi1"));
  REQUIRE(!harness.manager->hasSession(OTHER_SESSION_ID));
  REQUIRE(!harness.manager->hasSession(SESSION_ID));
}

TEST_CASE("Disconnected devices are forgotten", "[TerminalManager]") {
  ManagerHarness harness;
  harness.manager->attach("phone", SESSION_ID, nullopt);
  harness.events("phone", 1);

  harness.manager->onDeviceDisconnected("phone");
  REQUIRE(!harness.manager->getAttachedSession("phone"));
  REQUIRE(!harness.manager->isSessionAttached(SESSION_ID));

  harness.manager->onOutput(SESSION_ID, "nobody listening");
  harness.manager->shutdown();
  REQUIRE(harness.transport->getEvents("phone").size() == 1);
}

TEST_CASE("A failing device does not stop delivery", "[TerminalManager]") {
  ManagerHarness harness;
  harness.transport->failSend = true;
  harness.manager->attach("phone", SESSION_ID, nullopt);
  harness.manager->onOutput(SESSION_ID, "lost");

  // Let the failed sends drain before recovering
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  harness.transport->failSend = false;
  harness.manager->onOutput(SESSION_ID, "seen");

  harness.manager->shutdown();
  auto events = harness.transport->getEvents("phone");
  REQUIRE(!events.empty());
  REQUIRE(events.back().output().data() == "seen");
  REQUIRE(events.back().output().sequence() == 1);
}

TEST_CASE("Output matches become notifications", "[TerminalManager]") {
  ManagerHarness harness;
  harness.manager->onOutput(SESSION_ID, "compiling\n");
  harness.manager->onOutput(SESSION_ID, "Error: undefined reference\n");

  REQUIRE(harness.transport->waitForBroadcasts(1));
  auto broadcasts = harness.transport->getBroadcasts();
  REQUIRE(broadcasts[0].has_notification());
  const auto& notification = broadcasts[0].notification();
  REQUIRE(notification.session_id() == SESSION_ID);
  REQUIRE(notification.category() == NOTIFICATION_ERROR);
  REQUIRE(notification.title() == "My Agent: Error detected");
  REQUIRE(notification.snippet().find("undefined reference") != string::npos);

  // Same category again within the cooldown
  harness.manager->onOutput(SESSION_ID, "Error: again\n");
  harness.manager->shutdown();
  REQUIRE(harness.transport->getBroadcasts().size() == 1);
}

TEST_CASE("A failed broadcast does not start the cooldown",
          "[TerminalManager]") {
  TerminalManagerOptions options;
  // One sender keeps the two notifications in order
  options.sendThreads = 1;
  ManagerHarness harness(options);

  harness.transport->failBroadcast = true;
  harness.manager->onOutput(SESSION_ID, "Error: push is down\n");
  REQUIRE(harness.transport->waitForBroadcastAttempts(1));
  harness.transport->failBroadcast = false;

  harness.manager->onOutput(SESSION_ID, "Error: push is back\n");
  REQUIRE(harness.transport->waitForBroadcasts(1));
  auto notification = harness.transport->getBroadcasts()[0].notification();
  REQUIRE(notification.snippet().find("push is back") != string::npos);
  harness.manager->shutdown();
}

TEST_CASE("Notification title falls back to the session id",
          "[TerminalManager]") {
  ManagerHarness harness;
  harness.directory->add(OTHER_SESSION_ID, "other");
  harness.manager->onOutput(OTHER_SESSION_ID, "Continue? (y/n) ");
  REQUIRE(harness.transport->waitForBroadcasts(1));
  auto notification = harness.transport->getBroadcasts()[0].notification();
  REQUIRE(notification.category() == NOTIFICATION_APPROVAL);
  REQUIRE(notification.title() == OTHER_SESSION_ID + ": Approval needed");
}

TEST_CASE("Notifications can be disabled", "[TerminalManager]") {
  TerminalManagerOptions options;
  options.notificationsEnabled = false;
  ManagerHarness harness(options);
  harness.manager->attach("phone", SESSION_ID, nullopt);
  harness.manager->onOutput(SESSION_ID, "Error: ignored\n");
  harness.events("phone", 2);
  harness.manager->shutdown();
  REQUIRE(harness.transport->getBroadcasts().empty());
}

TEST_CASE("Resize goes to tmux", "[TerminalManager]") {
  ManagerHarness harness;
  REQUIRE(harness.manager->handleResize(SESSION_ID, 120, 40));
  auto resizes = harness.executor->getResizes();
  REQUIRE(resizes.size() == 1);
  REQUIRE(std::get<0>(resizes[0]) == TMUX_NAME);
  REQUIRE(std::get<1>(resizes[0]) == 120);
  REQUIRE(std::get<2>(resizes[0]) == 40);

  REQUIRE(!harness.manager->handleResize(OTHER_SESSION_ID, 80, 24));
  harness.executor->failResize = true;
  REQUIRE(!harness.manager->handleResize(SESSION_ID, 80, 24));
}
