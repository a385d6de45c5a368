#include "SubprocessUtils.hpp"

extern char** environ;

namespace tt {
namespace {
void setCloseOnExec(int fd) {
  int flags = fcntl(fd, F_GETFD);
  FATAL_FAIL(flags);
  FATAL_FAIL(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}

vector<string> mergeEnvironment(const vector<pair<string, string>>& extra) {
  map<string, string> merged;
  for (char** env = environ; env && *env; env++) {
    string entry(*env);
    auto eq = entry.find('=');
    if (eq == string::npos) continue;
    merged[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  for (const auto& it : extra) {
    merged[it.first] = it.second;
  }
  vector<string> result;
  for (const auto& it : merged) {
    result.push_back(it.first + "=" + it.second);
  }
  return result;
}

// Runs in the forked child: hands errno to the parent and exits
void reportChildError(int fd) {
  int e = errno;
  if (::write(fd, &e, sizeof(e)) != (ssize_t)sizeof(e)) {
    _exit(126);
  }
  _exit(127);
}

vector<char*> toCharArray(vector<string>& strings) {
  vector<char*> result;
  for (auto& s : strings) {
    result.push_back(&s[0]);
  }
  result.push_back(NULL);
  return result;
}
}  // namespace

SubprocessResult SubprocessUtils::run(const SubprocessRequest& request) {
  SubprocessResult result;
  if (request.argv.empty()) {
    result.error = "no command given";
    return result;
  }

  int stdoutPipe[2];
  int stderrPipe[2];
  int execErrorPipe[2];
  if (pipe(stdoutPipe) == -1 || pipe(stderrPipe) == -1 ||
      pipe(execErrorPipe) == -1) {
    result.error = string("pipe: ") + strerror(errno);
    return result;
  }
  setCloseOnExec(execErrorPipe[1]);

  // Everything the child needs is prepared before fork()
  vector<string> argvStrings = request.argv;
  vector<char*> argvArray = toCharArray(argvStrings);
  vector<string> envStrings = mergeEnvironment(request.environment);
  vector<char*> envArray = toCharArray(envStrings);

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    setpgid(0, 0);
    dup2(stdoutPipe[1], STDOUT_FILENO);
    dup2(stderrPipe[1], STDERR_FILENO);
    ::close(stdoutPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[0]);
    ::close(stderrPipe[1]);
    ::close(execErrorPipe[0]);
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
      dup2(devNull, STDIN_FILENO);
      ::close(devNull);
    }
    if (!request.workingDirectory.empty() &&
        chdir(request.workingDirectory.c_str()) == -1) {
      reportChildError(execErrorPipe[1]);
    }
    environ = envArray.data();
    execvp(argvArray[0], argvArray.data());
    reportChildError(execErrorPipe[1]);
  } else if (pid < 0) {
    result.error = string("fork: ") + strerror(errno);
    for (int fd : {stdoutPipe[0], stdoutPipe[1], stderrPipe[0], stderrPipe[1],
                   execErrorPipe[0], execErrorPipe[1]}) {
      ::close(fd);
    }
    return result;
  }

  // parent process; EACCES means the child already exec'd after its own setpgid
  if (setpgid(pid, pid) == -1 && errno != EACCES) {
    VLOG(1) << "setpgid failed: " << strerror(errno);
  }
  ::close(stdoutPipe[1]);
  ::close(stderrPipe[1]);
  ::close(execErrorPipe[1]);

  auto deadline = std::chrono::steady_clock::now() + request.timeout;
  struct pollfd fds[2];
  fds[0].fd = stdoutPipe[0];
  fds[0].events = POLLIN;
  fds[1].fd = stderrPipe[0];
  fds[1].events = POLLIN;
  int openStreams = 2;
  char buf[4096];
  while (openStreams > 0) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timedOut = true;
      break;
    }
    int rc = ::poll(fds, 2, (int)remaining.count());
    if (rc == -1) {
      if (errno == EINTR) continue;
      result.error = string("poll: ") + strerror(errno);
      break;
    }
    for (int a = 0; a < 2; a++) {
      if (fds[a].fd < 0 || !(fds[a].revents & (POLLIN | POLLHUP | POLLERR))) {
        continue;
      }
      ssize_t nbytes = ::read(fds[a].fd, buf, sizeof(buf));
      if (nbytes > 0) {
        (a == 0 ? result.standardOutput : result.standardError)
            .append(buf, nbytes);
      } else if (nbytes == 0 || errno != EINTR) {
        ::close(fds[a].fd);
        fds[a].fd = -1;
        openStreams--;
      }
    }
  }

  if (result.timedOut || !result.error.empty()) {
    VLOG(1) << "Killing process group " << pid;
    ::kill(-pid, SIGKILL);
  }
  for (int a = 0; a < 2; a++) {
    if (fds[a].fd >= 0) {
      ::close(fds[a].fd);
    }
  }

  // The pipes can close before the process exits, so keep the deadline
  int status = 0;
  while (true) {
    pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited == -1) {
      if (errno == EINTR) continue;
      result.error = string("waitpid: ") + strerror(errno);
      break;
    }
    if (!result.timedOut && std::chrono::steady_clock::now() >= deadline) {
      result.timedOut = true;
      ::kill(-pid, SIGKILL);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  int execErrno = 0;
  ssize_t execErrorBytes =
      ::read(execErrorPipe[0], &execErrno, sizeof(execErrno));
  ::close(execErrorPipe[0]);

  if (execErrorBytes == (ssize_t)sizeof(execErrno)) {
    result.exitCode = -1;
    result.error = "exec " + request.argv[0] + ": " + strerror(execErrno);
  } else if (result.timedOut) {
    result.exitCode = -1;
    result.error = "timed out after " + to_string(request.timeout.count()) +
                   "ms";
  } else if (WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
    if (result.exitCode != 0 && result.error.empty()) {
      result.error = "exit status " + to_string(result.exitCode);
    }
  } else if (WIFSIGNALED(status)) {
    result.exitCode = -1;
    if (result.error.empty()) {
      result.error = string("signal: ") + strsignal(WTERMSIG(status));
    }
  }
  return result;
}
}  // namespace tt
