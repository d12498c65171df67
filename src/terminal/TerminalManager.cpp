#include "TerminalManager.hpp"

#include "KeyEncoder.hpp"

namespace ras {
TerminalManager::TerminalManager(
    shared_ptr<SessionDirectory> _directory,
    shared_ptr<ProcessExecutor> _executor,
    shared_ptr<DeviceTransport> _transport,
    shared_ptr<const NotificationConfig> _notificationConfig,
    const TerminalManagerOptions& _options)
    : directory(_directory),
      executor(_executor),
      transport(_transport),
      notificationConfig(_notificationConfig),
      options(_options),
      rateLimiter(_options.rateLimitPerSecond),
      sendPool(new ThreadPool(max(1, _options.sendThreads))) {
  if (options.notificationsEnabled) {
    compiledPatterns = CompiledPatterns::compile(*notificationConfig);
    LOG(INFO) << "Notifications enabled with " << compiledPatterns->size()
              << " patterns";
  }
}

TerminalManager::~TerminalManager() { shutdown(); }

void TerminalManager::attach(const string& deviceId, const string& sessionId,
                             optional<uint64_t> lastSeenSequence) {
  auto validationError = InputValidator::validateSessionId(sessionId);
  if (validationError) {
    reportError(deviceId, sessionId, validationError->code,
                validationError->message);
    return;
  }

  auto info = directory->lookup(sessionId);
  if (!info) {
    reportError(deviceId, sessionId, TerminalErrorCode::SESSION_NOT_FOUND,
                "Session not found");
    return;
  }
  if (info->status == SessionStatus::KILLING) {
    reportError(deviceId, sessionId, TerminalErrorCode::SESSION_KILLING,
                "Session is being killed");
    return;
  }

  auto session = getOrCreateSession(sessionId);
  // Holding the output lock keeps live output from slipping in between the
  // replay snapshot and the device joining the fan-out.
  lock_guard<std::mutex> guard(session->outputMutex);
  if (session->tornDown) {
    reportError(deviceId, sessionId, TerminalErrorCode::SESSION_NOT_FOUND,
                "Session not found");
    return;
  }
  session->attachments.insert(deviceId);
  LOG(INFO) << "Device " << deviceId << " attached to " << sessionId;

  {
    TerminalEvent event;
    TerminalAttached* attached = event.mutable_attached();
    attached->set_session_id(sessionId);
    attached->set_buffer_start_sequence(session->buffer.getStartSequence());
    attached->set_current_sequence(session->buffer.getCurrentSequence());
    sendEvent(deviceId, event);
  }

  if (!lastSeenSequence) {
    return;
  }
  if (*lastSeenSequence >= session->buffer.getCurrentSequence()) {
    // Nothing newer exists, and adding one could wrap around
    VLOG(1) << "Device " << deviceId << " is caught up on " << sessionId;
    return;
  }
  ReplayRange range = session->buffer.getFrom(*lastSeenSequence + 1);
  if (range.gapMarker) {
    uint64_t firstRetained = range.chunks.front().sequence;
    LOG(INFO) << "Device " << deviceId << " missed output " << *range.gapMarker
              << " to " << (firstRetained - 1) << " of " << sessionId;
    TerminalEvent event;
    OutputSkipped* skipped = event.mutable_skipped();
    skipped->set_session_id(sessionId);
    skipped->set_from_sequence(*range.gapMarker);
    skipped->set_to_sequence(firstRetained - 1);
    sendEvent(deviceId, event);
  }
  VLOG(1) << "Replaying " << range.chunks.size() << " chunks of " << sessionId
          << " to " << deviceId;
  for (const auto& chunk : range.chunks) {
    TerminalEvent event;
    TerminalOutput* output = event.mutable_output();
    output->set_session_id(sessionId);
    output->set_sequence(chunk.sequence);
    output->set_data(chunk.data);
    sendEvent(deviceId, event);
  }
}

void TerminalManager::detach(const string& deviceId, const string& sessionId) {
  auto session = getSession(sessionId);
  if (session) {
    lock_guard<std::mutex> guard(session->outputMutex);
    session->attachments.erase(deviceId);
  }
  LOG(INFO) << "Device " << deviceId << " detached from " << sessionId;

  TerminalEvent event;
  TerminalDetached* detached = event.mutable_detached();
  detached->set_session_id(sessionId);
  detached->set_reason("user_request");
  sendEvent(deviceId, event);
}

void TerminalManager::handleInput(const string& deviceId,
                                  const TerminalInput& input) {
  const string& sessionId = input.session_id();
  auto validationError = InputValidator::validateSessionId(sessionId);
  if (validationError) {
    reportError(deviceId, sessionId, validationError->code,
                validationError->message);
    return;
  }

  auto session = getSession(sessionId);
  bool attached = false;
  if (session) {
    lock_guard<std::mutex> guard(session->outputMutex);
    attached = session->attachments.count(deviceId) > 0;
  }
  if (!attached) {
    reportError(deviceId, sessionId, TerminalErrorCode::NOT_ATTACHED,
                "Not attached to session");
    return;
  }

  auto info = directory->lookup(sessionId);
  if (!info) {
    reportError(deviceId, sessionId, TerminalErrorCode::SESSION_NOT_FOUND,
                "Session not found");
    return;
  }

  if (!rateLimiter.tryAcquire(sessionId)) {
    reportError(deviceId, sessionId, TerminalErrorCode::RATE_LIMITED,
                "Too many input messages, slow down");
    return;
  }

  string keys;
  switch (input.input_case()) {
    case TerminalInput::kData: {
      auto sizeError = InputValidator::validateInputData(input.data());
      if (sizeError) {
        reportError(deviceId, sessionId, sizeError->code, sizeError->message);
        return;
      }
      keys = input.data();
      break;
    }
    case TerminalInput::kSpecial:
      keys = KeyEncoder::encode(input.special().key(),
                                input.special().modifiers());
      if (keys.empty()) {
        LOG(WARNING) << "Ignoring unknown key " << input.special().key()
                     << " from " << deviceId;
        return;
      }
      break;
    default:
      VLOG(1) << "Empty input from " << deviceId;
      return;
  }
  if (keys.empty()) {
    return;
  }

  bool sent = false;
  try {
    sent = executor->sendKeys(info->multiplexerName, keys);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Sending keys to " << info->multiplexerName
               << " failed: " << re.what();
  }
  if (!sent) {
    reportError(deviceId, sessionId, TerminalErrorCode::PIPE_ERROR,
                "Failed to send input to session");
  }
}

bool TerminalManager::handleResize(const string& sessionId, int cols,
                                   int rows) {
  auto info = directory->lookup(sessionId);
  if (!info) {
    LOG(WARNING) << "Resize for unknown session " << sessionId;
    return false;
  }
  try {
    return executor->resize(info->multiplexerName, cols, rows);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Resizing " << info->multiplexerName
               << " failed: " << re.what();
    return false;
  }
}

void TerminalManager::onOutput(const string& sessionId, const string& data) {
  if (data.empty()) {
    return;
  }
  auto session = getSession(sessionId);
  if (!session) {
    auto info = directory->lookup(sessionId);
    if (!info || info->status == SessionStatus::KILLING) {
      VLOG(1) << "Dropping output for unknown session " << sessionId;
      return;
    }
    session = getOrCreateSession(sessionId);
  }

  {
    lock_guard<std::mutex> guard(session->outputMutex);
    if (session->tornDown) {
      return;
    }
    uint64_t sequence = session->buffer.append(data);
    if (!session->attachments.empty()) {
      TerminalEvent event;
      TerminalOutput* output = event.mutable_output();
      output->set_session_id(sessionId);
      output->set_sequence(sequence);
      output->set_data(data);
      string serialized = protoToString(event);
      for (const auto& deviceId : session->attachments) {
        enqueueEvent(deviceId, serialized);
      }
    }
  }

  if (session->matcher) {
    auto matches = session->matcher->processChunk(data);
    if (!matches.empty()) {
      notifyMatches(sessionId, session, matches);
    }
  }
}

void TerminalManager::onSessionKilled(const string& sessionId) {
  shared_ptr<SessionState> session;
  {
    lock_guard<std::mutex> guard(sessionsMutex);
    auto it = sessions.find(sessionId);
    if (it != sessions.end()) {
      session = it->second;
      sessions.erase(it);
    }
  }
  rateLimiter.reset(sessionId);
  if (!session) {
    return;
  }

  unordered_set<string> devices;
  {
    lock_guard<std::mutex> guard(session->outputMutex);
    session->tornDown = true;
    devices.swap(session->attachments);
    session->buffer.clear();
  }
  if (session->matcher) {
    session->matcher->reset();
  }
  if (session->dispatcher) {
    session->dispatcher->clear();
  }

  LOG(INFO) << "Session " << sessionId << " killed, detaching "
            << devices.size() << " devices";
  for (const auto& deviceId : devices) {
    TerminalEvent event;
    TerminalDetached* detached = event.mutable_detached();
    detached->set_session_id(sessionId);
    detached->set_reason("session_killed");
    sendEvent(deviceId, event);
  }
}

void TerminalManager::onDeviceDisconnected(const string& deviceId) {
  vector<shared_ptr<SessionState>> snapshot;
  {
    lock_guard<std::mutex> guard(sessionsMutex);
    for (const auto& it : sessions) {
      snapshot.push_back(it.second);
    }
  }
  for (const auto& session : snapshot) {
    lock_guard<std::mutex> guard(session->outputMutex);
    session->attachments.erase(deviceId);
  }

  lock_guard<std::mutex> guard(outboxesMutex);
  auto it = outboxes.find(deviceId);
  if (it != outboxes.end()) {
    it->second->clear();
    outboxes.erase(it);
  }
  LOG(INFO) << "Device " << deviceId << " disconnected";
}

void TerminalManager::reportError(const string& deviceId,
                                  const string& sessionId, const string& code,
                                  const string& message) {
  LOG(WARNING) << "Terminal error for " << deviceId << " on " << sessionId
               << ": " << code << " (" << message << ")";
  TerminalEvent event;
  TerminalError* error = event.mutable_error();
  error->set_session_id(sessionId);
  error->set_code(code);
  error->set_message(message);
  sendEvent(deviceId, event);
}

size_t TerminalManager::getAttachmentCount(const string& sessionId) {
  auto session = getSession(sessionId);
  if (!session) {
    return 0;
  }
  lock_guard<std::mutex> guard(session->outputMutex);
  return session->attachments.size();
}

bool TerminalManager::isSessionAttached(const string& sessionId) {
  return getAttachmentCount(sessionId) > 0;
}

bool TerminalManager::hasSession(const string& sessionId) {
  return getSession(sessionId) != nullptr;
}

optional<string> TerminalManager::getAttachedSession(const string& deviceId) {
  lock_guard<std::mutex> guard(sessionsMutex);
  for (const auto& it : sessions) {
    lock_guard<std::mutex> sessionGuard(it.second->outputMutex);
    if (it.second->attachments.count(deviceId)) {
      return it.first;
    }
  }
  return nullopt;
}

void TerminalManager::shutdown() {
  std::unique_ptr<ThreadPool> pool;
  {
    lock_guard<std::mutex> guard(poolMutex);
    pool = std::move(sendPool);
  }
  // Joins the workers once everything already queued has been delivered
  pool.reset();

  {
    lock_guard<std::mutex> guard(sessionsMutex);
    sessions.clear();
  }
  {
    lock_guard<std::mutex> guard(outboxesMutex);
    outboxes.clear();
  }
}

shared_ptr<TerminalManager::SessionState> TerminalManager::getSession(
    const string& sessionId) {
  lock_guard<std::mutex> guard(sessionsMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return nullptr;
  }
  return it->second;
}

shared_ptr<TerminalManager::SessionState> TerminalManager::getOrCreateSession(
    const string& sessionId) {
  lock_guard<std::mutex> guard(sessionsMutex);
  auto it = sessions.find(sessionId);
  if (it != sessions.end()) {
    return it->second;
  }

  auto session = make_shared<SessionState>(options.bufferSize);
  if (options.notificationsEnabled) {
    session->matcher.reset(
        new PatternMatcher(notificationConfig, compiledPatterns));
    session->dispatcher.reset(new NotificationDispatcher(
        sessionId, notificationConfig->cooldownSeconds,
        [this](const string& event) { broadcastEvent(event); }));
  }
  sessions[sessionId] = session;
  LOG(INFO) << "Tracking output of session " << sessionId;
  return session;
}

void TerminalManager::sendEvent(const string& deviceId,
                                const TerminalEvent& event) {
  enqueueEvent(deviceId, protoToString(event));
}

void TerminalManager::enqueueEvent(const string& deviceId,
                                   const string& serializedEvent) {
  shared_ptr<DeviceOutbox> outbox;
  {
    lock_guard<std::mutex> guard(outboxesMutex);
    auto it = outboxes.find(deviceId);
    if (it == outboxes.end()) {
      it = outboxes
               .emplace(deviceId, make_shared<DeviceOutbox>(
                                      deviceId, options.maxPendingEvents))
               .first;
    }
    outbox = it->second;
  }

  if (outbox->enqueue(serializedEvent) !=
      OutboxWriteState::QUEUED_START_DRAIN) {
    return;
  }
  lock_guard<std::mutex> guard(poolMutex);
  if (!sendPool) {
    VLOG(1) << "Dropping event for " << deviceId << " after shutdown";
    outbox->clear();
    return;
  }
  sendPool->enqueue([this, outbox]() { drainOutbox(outbox); });
}

void TerminalManager::drainOutbox(shared_ptr<DeviceOutbox> outbox) {
  string event;
  while (outbox->popForDrain(&event)) {
    try {
      transport->send(outbox->getDeviceId(), event);
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Failed to send event to " << outbox->getDeviceId()
                   << ": " << re.what();
    }
  }
}

void TerminalManager::broadcastEvent(const string& serializedEvent) {
  transport->broadcast(serializedEvent);
}

void TerminalManager::notifyMatches(const string& sessionId,
                                    const shared_ptr<SessionState>& session,
                                    const vector<MatchResult>& matches) {
  string displayName = sessionId;
  auto info = directory->lookup(sessionId);
  if (info && info->displayName) {
    displayName = *info->displayName;
  }

  // The dispatcher calls the transport directly, so it runs on the send
  // pool and learns whether the broadcast went out before starting the
  // cooldown.
  lock_guard<std::mutex> guard(poolMutex);
  if (!sendPool) {
    VLOG(1) << "Dropping " << matches.size() << " notifications for "
            << sessionId << " after shutdown";
    return;
  }
  sendPool->enqueue([session, matches, displayName]() {
    for (const auto& match : matches) {
      session->dispatcher->maybeNotify(match, displayName);
    }
  });
}
}  // namespace ras
