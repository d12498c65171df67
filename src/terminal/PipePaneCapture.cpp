#include "PipePaneCapture.hpp"

namespace ras {
PipePaneCapture::PipePaneCapture(shared_ptr<SubprocessUtils> _subprocess,
                                 const string& _sessionId,
                                 const string& _multiplexerName,
                                 OutputCallback _onOutput,
                                 const TmuxConfig& _config)
    : subprocess(_subprocess),
      sessionId(_sessionId),
      multiplexerName(_multiplexerName),
      onOutput(_onOutput),
      config(_config),
      readFd(-1),
      keepaliveFd(-1),
      running(false) {}

PipePaneCapture::~PipePaneCapture() { stop(); }

void PipePaneCapture::start() {
  if (running) {
    return;
  }
  string fifoDirectory = GetTempDirectory() + "ras";
  try {
    fs::create_directories(fifoDirectory);
    fs::permissions(fifoDirectory, fs::perms::owner_all);
  } catch (const fs::filesystem_error& fse) {
    throw std::runtime_error(string("Cannot create fifo directory: ") +
                             fse.what());
  }

  fifoPath = fifoDirectory + "/term-" + sessionId + ".fifo";
  ::unlink(fifoPath.c_str());
  if (::mkfifo(fifoPath.c_str(), S_IRUSR | S_IWUSR) == -1) {
    throw std::runtime_error("mkfifo " + fifoPath +
                             " failed: " + strerror(GetErrno()));
  }

  readFd = ::open(fifoPath.c_str(), O_RDONLY | O_NONBLOCK);
  if (readFd >= 0) {
    keepaliveFd = ::open(fifoPath.c_str(), O_WRONLY | O_NONBLOCK);
  }
  if (readFd < 0 || keepaliveFd < 0) {
    string error = strerror(GetErrno());
    closeFifo();
    throw std::runtime_error("Cannot open " + fifoPath + ": " + error);
  }

  string output;
  int exitCode = subprocess->runCommand(
      config.path,
      config.buildArgs({"pipe-pane", "-o", "-t", multiplexerName,
                        "cat >> '" + fifoPath + "'"}),
      &output);
  if (exitCode != 0) {
    closeFifo();
    throw std::runtime_error("pipe-pane failed: " + output);
  }

  running = true;
  readerThread = std::thread(&PipePaneCapture::readLoop, this);
  LOG(INFO) << "Capturing " << multiplexerName << " through " << fifoPath;
}

void PipePaneCapture::stop() {
  if (!running) {
    return;
  }
  running = false;
  if (readerThread.joinable()) {
    readerThread.join();
  }

  string output;
  int exitCode = subprocess->runCommand(
      config.path, config.buildArgs({"pipe-pane", "-t", multiplexerName}),
      &output);
  if (exitCode != 0) {
    LOG(WARNING) << "Could not disable pipe-pane for " << multiplexerName
                 << ": " << output;
  }
  closeFifo();
  LOG(INFO) << "Stopped capturing " << multiplexerName;
}

void PipePaneCapture::readLoop() {
  el::Helpers::setThreadName("capture-" + sessionId);
  string pending;
  auto interval = std::chrono::milliseconds(config.chunkIntervalMs);
  auto lastEmit = std::chrono::steady_clock::now();
  char buf[4096];

  while (running) {
    fd_set readSet;
    FD_ZERO(&readSet);
    FD_SET(readFd, &readSet);
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10 * 1000;
    int rc = select(readFd + 1, &readSet, NULL, NULL, &tv);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      STERROR << "select on " << fifoPath << " failed: " << strerror(GetErrno());
      break;
    }
    if (rc > 0 && FD_ISSET(readFd, &readSet)) {
      ssize_t bytesRead = ::read(readFd, buf, sizeof(buf));
      if (bytesRead > 0) {
        pending.append(buf, bytesRead);
      } else if (bytesRead < 0 && GetErrno() != EAGAIN &&
                 GetErrno() != EINTR) {
        STERROR << "read on " << fifoPath << " failed: " << strerror(GetErrno());
        break;
      }
    }

    auto now = std::chrono::steady_clock::now();
    while (pending.size() >= config.maxChunkSize) {
      emit(pending.substr(0, config.maxChunkSize));
      pending.erase(0, config.maxChunkSize);
      lastEmit = now;
    }
    if (!pending.empty() && now - lastEmit >= interval) {
      emit(pending);
      pending.clear();
      lastEmit = now;
    }
  }
  if (!pending.empty()) {
    emit(pending);
  }
}

void PipePaneCapture::emit(const string& data) {
  try {
    onOutput(sessionId, data);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Output handler for " << sessionId << " failed: " << re.what();
  }
}

void PipePaneCapture::closeFifo() {
  if (readFd >= 0) {
    ::close(readFd);
    readFd = -1;
  }
  if (keepaliveFd >= 0) {
    ::close(keepaliveFd);
    keepaliveFd = -1;
  }
  if (!fifoPath.empty()) {
    ::unlink(fifoPath.c_str());
  }
}
}  // namespace ras
