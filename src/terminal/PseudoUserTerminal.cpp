#include "PseudoUserTerminal.hpp"

#include "SessionErrors.hpp"

namespace capterm {
PseudoUserTerminal::PseudoUserTerminal()
    : pid(-1), running(false), masterFd(-1) {}

PseudoUserTerminal::~PseudoUserTerminal() { cleanup(); }

int PseudoUserTerminal::setup(const vector<string>& args) {
  if (args.empty()) {
    throw SetupError("empty command");
  }
  if (masterFd >= 0) {
    throw std::runtime_error("PseudoUserTerminal is already running");
  }

  // Everything the child needs is built before forking.
  vector<char*> argv;
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(NULL);

  // The child reports a failed exec through this pipe.  A successful exec
  // closes it, which the parent sees as EOF.
  int execErrorPipe[2];
  createCloexecPipe(execErrorPipe);

  int newMasterFd = -1;
  pid_t newPid = forkpty(&newMasterFd, NULL, NULL, NULL);
  switch (newPid) {
    case -1: {
      int forkErrno = GetErrno();
      ::close(execErrorPipe[0]);
      ::close(execErrorPipe[1]);
      throw SetupError(string("Error creating pseudo-terminal: ") +
                       strerror(forkErrno));
    }
    case 0:
      ::close(execErrorPipe[0]);
      runCommand(argv.data(), execErrorPipe[1]);
      break;
    default:
      // parent
      break;
  }

  ::close(execErrorPipe[1]);
  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(execErrorPipe[0], &childErrno, sizeof(childErrno));
  } while (rc < 0 && GetErrno() == EINTR);
  ::close(execErrorPipe[0]);

  if (rc > 0) {
    int status;
    while (waitpid(newPid, &status, 0) == -1 && GetErrno() == EINTR) {
    }
    ::close(newMasterFd);
    throw SetupError("Error starting " + args[0] + ": " +
                     strerror(childErrno));
  }

  // Keep the master out of any process spawned by a concurrent session.
  FATAL_FAIL(::fcntl(newMasterFd, F_SETFD, FD_CLOEXEC));

  {
    lock_guard<std::mutex> guard(childMutex);
    pid = newPid;
    running = true;
    masterFd = newMasterFd;
  }
  VLOG(1) << "Started " << args[0] << " as pid " << pid << " on pty "
          << masterFd;
  return masterFd;
}

void PseudoUserTerminal::runCommand(char* const* argv, int execErrorFd) {
  // Put back default dispositions so the command does not inherit ours.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGWINCH, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  signal(SIGINT, SIG_DFL);
  execvp(argv[0], argv);

  int execErrno = errno;
  ssize_t ignored = ::write(execErrorFd, &execErrno, sizeof(execErrno));
  (void)ignored;
  _exit(127);
}

int PseudoUserTerminal::waitForExit() {
  {
    lock_guard<std::mutex> guard(childMutex);
    if (!running) {
      throw std::runtime_error("No child process to wait for");
    }
  }

  // Wait without reaping first, so terminate() never signals a pid that has
  // already been recycled.
  siginfo_t childInfo;
  memset(&childInfo, 0, sizeof(childInfo));
  while (waitid(P_PID, pid, &childInfo, WEXITED | WNOWAIT) == -1) {
    if (GetErrno() != EINTR) {
      STERROR << "Error waiting for pid " << pid << ": "
              << strerror(GetErrno());
      throw std::runtime_error(string("waitid failed: ") +
                               strerror(GetErrno()));
    }
  }

  lock_guard<std::mutex> guard(childMutex);
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      STERROR << "Error reaping pid " << pid << ": " << strerror(GetErrno());
      throw std::runtime_error(string("waitpid failed: ") +
                               strerror(GetErrno()));
    }
  }
  running = false;
  VLOG(1) << "pid " << pid << " exited with status " << status;
  return status;
}

void PseudoUserTerminal::terminate(int signal) {
  lock_guard<std::mutex> guard(childMutex);
  if (!running) {
    return;
  }
  LOG(INFO) << "Sending signal " << signal << " to pid " << pid;
  if (::kill(pid, signal) == -1) {
    LOG(WARNING) << "Could not signal pid " << pid << ": "
                 << strerror(GetErrno());
  }
}

void PseudoUserTerminal::cleanup() {
  lock_guard<std::mutex> guard(childMutex);
  if (running) {
    LOG(WARNING) << "Killing pid " << pid << " during cleanup";
    ::kill(pid, SIGKILL);
    int status;
    while (waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
    }
    running = false;
  }
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
}

void PseudoUserTerminal::setInfo(const winsize& tmpwin) {
  if (masterFd < 0) {
    return;
  }
  if (ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    LOG(WARNING) << "Could not resize pty: " << strerror(GetErrno());
  } else {
    VLOG(1) << "pty resized to " << tmpwin.ws_row << "x" << tmpwin.ws_col;
  }
}
}  // namespace capterm
