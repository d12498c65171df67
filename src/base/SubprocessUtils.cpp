#include "SubprocessUtils.hpp"

namespace ras {
int SubprocessUtils::runCommand(const string& command,
                                const vector<string>& args, string* output) {
  int link_client[2];
  char buf_client[4096];
  if (pipe(link_client) == -1) {
    LOG(ERROR) << "pipe() failed: " << strerror(GetErrno());
    return -1;
  }

  // Build argv before forking; only async-signal-safe calls after fork().
  vector<char*> argsArray;
  argsArray.push_back(const_cast<char*>(command.c_str()));
  for (const auto& arg : args) {
    argsArray.push_back(const_cast<char*>(arg.c_str()));
  }
  argsArray.push_back(NULL);

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    dup2(link_client[1], STDOUT_FILENO);
    dup2(link_client[1], STDERR_FILENO);
    close(link_client[0]);
    close(link_client[1]);
    execvp(command.c_str(), argsArray.data());
    _exit(127);
  } else if (pid < 0) {
    LOG(ERROR) << "Failed to fork " << command << ": " << strerror(GetErrno());
    close(link_client[0]);
    close(link_client[1]);
    return -1;
  }

  // parent process
  close(link_client[1]);
  string childOutput;
  while (true) {
    ssize_t nbytes = read(link_client[0], buf_client, sizeof(buf_client));
    if (nbytes < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (nbytes <= 0) {
      break;
    }
    childOutput.append(buf_client, nbytes);
  }
  close(link_client[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      LOG(ERROR) << "waitpid failed for " << command << ": "
                 << strerror(GetErrno());
      return -1;
    }
  }
  if (output) {
    *output = childOutput;
  }
  if (!WIFEXITED(status)) {
    return -1;
  }
  int exitCode = WEXITSTATUS(status);
  VLOG(2) << command << " exited with " << exitCode;
  return exitCode;
}

}  // namespace ras
