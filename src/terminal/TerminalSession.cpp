#include "TerminalSession.hpp"

#include "PseudoTerminalConsole.hpp"
#include "PseudoUserTerminal.hpp"
#include "RawFdUtils.hpp"
#include "WindowSizeWatcher.hpp"

namespace capterm {
namespace {
#define RELAY_BUF_SIZE (16 * 1024)

// Once the program has exited, the output relay keeps reading until the pty
// has been quiet this long (or reports EIO), bounded by the total.
const int DRAIN_QUIET_MS = 100;
const int DRAIN_MAX_MS = 2000;

/**
 * @brief Raw mode for the lifetime of a session.  restore() may run early and
 * the destructor runs it again harmlessly.
 */
class ScopedRawMode {
 public:
  explicit ScopedRawMode(shared_ptr<Console> _console) : console(_console) {
    console->setup();
  }
  ~ScopedRawMode() { restore(); }

  void restore() { console->teardown(); }

 private:
  shared_ptr<Console> console;
};

/**
 * @brief Both relays poll the read end; one byte on the write end stops
 * them.
 */
class WakePipe {
 public:
  WakePipe() { createCloexecPipe(fds); }
  ~WakePipe() {
    ::close(fds[0]);
    ::close(fds[1]);
  }

  int getReadFd() const { return fds[0]; }

  void signal() {
    char c = 'X';
    FATAL_FAIL(::write(fds[1], &c, 1));
  }

 private:
  int fds[2];
};
}  // namespace

TerminalSession::TerminalSession()
    : console(new PseudoTerminalConsole()),
      userTerminalFactory([]() -> shared_ptr<UserTerminal> {
        return shared_ptr<UserTerminal>(new PseudoUserTerminal());
      }) {}

TerminalSession::TerminalSession(shared_ptr<Console> _console,
                                 UserTerminalFactory _userTerminalFactory)
    : console(_console), userTerminalFactory(_userTerminalFactory) {}

CaptureResult TerminalSession::execute(const string& commandLine) {
  lock_guard<std::mutex> guard(executeMutex);
  CaptureResult result;
  try {
    auto args = splitOnWhitespace(commandLine);
    if (args.empty()) {
      throw SetupError("empty command");
    }
    LOG(INFO) << "Executing: " << join(args, " ");
    runSession(args, &result);
  } catch (const SetupError& se) {
    LOG(WARNING) << "Could not run '" << commandLine << "': " << se.what();
    result.Clear();
    result.set_output("");
    result.set_error_type(SETUP_ERROR);
    result.set_error(se.what());
  }
  return result;
}

void TerminalSession::terminate(int signal) {
  lock_guard<std::mutex> guard(activeTerminalMutex);
  if (activeTerminal) {
    activeTerminal->terminate(signal);
  }
}

bool TerminalSession::isRunning() {
  lock_guard<std::mutex> guard(activeTerminalMutex);
  return activeTerminal.get() != NULL;
}

void TerminalSession::setActiveTerminal(shared_ptr<UserTerminal> term) {
  lock_guard<std::mutex> guard(activeTerminalMutex);
  activeTerminal = term;
}

void TerminalSession::runSession(const vector<string>& args,
                                 CaptureResult* result) {
  TerminalInfo terminalInfo = console->getTerminalInfo();
  int rows =
      terminalInfo.row() > 0 ? terminalInfo.row() : DEFAULT_TERMINAL_ROWS;
  int cols = terminalInfo.column() > 0 ? terminalInfo.column()
                                       : DEFAULT_TERMINAL_COLUMNS;

  shared_ptr<UserTerminal> term = userTerminalFactory();
  int masterFd = term->setup(args);
  setActiveTerminal(term);
  // Kills a child we never waited for and closes the master on every exit
  // path.
  struct TerminalCleanup {
    TerminalSession* session;
    shared_ptr<UserTerminal> term;
    ~TerminalCleanup() { run(); }
    void run() {
      if (!term) {
        return;
      }
      session->setActiveTerminal(shared_ptr<UserTerminal>());
      term->cleanup();
      term.reset();
    }
  } termCleanup = {this, term};

  term->setInfo(toWinsize(terminalInfo));

  // A program that stops reading its terminal must not block the input
  // relay past the end of the session.
  int masterFlags = ::fcntl(masterFd, F_GETFL);
  FATAL_FAIL(masterFlags);
  FATAL_FAIL(::fcntl(masterFd, F_SETFL, masterFlags | O_NONBLOCK));

  shared_ptr<Console> localConsole = console;
  WindowSizeWatcher resizeWatcher([localConsole, term]() {
    term->setInfo(toWinsize(localConsole->getTerminalInfo()));
  });
  try {
    resizeWatcher.start();
  } catch (const std::runtime_error& re) {
    throw SetupError(re.what());
  }

  ScopedRawMode rawMode(console);

  ScreenBuffer screen(rows, cols);
  WakePipe wakePipe;
  std::thread inputThread(&TerminalSession::inputRelay, this, masterFd,
                          wakePipe.getReadFd());
  std::thread outputThread(&TerminalSession::outputRelay, this, masterFd,
                           wakePipe.getReadFd(), &screen);

  int status = 0;
  string waitError;
  try {
    status = term->waitForExit();
  } catch (const std::runtime_error& re) {
    waitError = re.what();
  }

  // Closing our side of the session stops both relays.
  wakePipe.signal();
  outputThread.join();
  inputThread.join();
  VLOG(1) << "Relays finished";

  resizeWatcher.stop();
  rawMode.restore();
  termCleanup.run();

  result->set_output(screen.render());
  if (!waitError.empty()) {
    result->set_error_type(RUNTIME_ERROR);
    result->set_error(waitError);
    return;
  }
  fillExitStatus(status, result);
  LOG(INFO) << args[0] << " finished: "
            << (result->has_error() ? result->error() : "ok");
}

void TerminalSession::inputRelay(int masterFd, int wakeFd) {
  el::Helpers::setThreadName("input-relay");
  int inputFd = console->getInputFd();
  char buf[RELAY_BUF_SIZE];
  while (true) {
    pollfd fds[2];
    fds[0].fd = inputFd;
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = wakeFd;
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      STERROR << "poll failed in input relay: " << strerror(GetErrno());
      break;
    }
    if (fds[1].revents & POLLIN) {
      VLOG(1) << "Input relay stopping";
      break;
    }
    if (fds[0].revents & POLLNVAL) {
      VLOG(1) << "Console input is not open";
      break;
    }
    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
      ssize_t n = RawFdUtils::readSome(inputFd, buf, sizeof(buf));
      if (n > 0) {
        try {
          if (!RawFdUtils::writeAllUntilWoken(masterFd, buf, n, wakeFd)) {
            VLOG(1) << "Input relay stopping with unread input";
            break;
          }
        } catch (const std::runtime_error& re) {
          VLOG(1) << "pty no longer accepts input: " << re.what();
          break;
        }
      } else if (n == 0) {
        VLOG(1) << "Console input reached EOF";
        break;
      } else if (GetErrno() != EAGAIN && GetErrno() != EWOULDBLOCK) {
        VLOG(1) << "Console read ended: " << strerror(GetErrno());
        break;
      }
    }
  }
}

void TerminalSession::outputRelay(int masterFd, int wakeFd,
                                  ScreenBuffer* screen) {
  el::Helpers::setThreadName("output-relay");
  char buf[RELAY_BUF_SIZE];
  bool draining = false;
  bool consoleOpen = true;
  auto drainStart = std::chrono::steady_clock::now();
  while (true) {
    pollfd fds[2];
    fds[0].fd = masterFd;
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = wakeFd;
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    int rc = ::poll(fds, draining ? 1 : 2, draining ? DRAIN_QUIET_MS : -1);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      STERROR << "poll failed in output relay: " << strerror(GetErrno());
      break;
    }
    if (rc == 0) {
      VLOG(1) << "pty drained";
      break;
    }
    if (!draining && (fds[1].revents & POLLIN)) {
      draining = true;
      drainStart = std::chrono::steady_clock::now();
    }
    if (draining &&
        std::chrono::steady_clock::now() - drainStart >
            std::chrono::milliseconds(DRAIN_MAX_MS)) {
      LOG(WARNING) << "pty still producing output after the program exited, "
                      "giving up";
      break;
    }
    if (fds[0].revents & POLLNVAL) {
      break;
    }
    if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
      continue;
    }

    ssize_t n = RawFdUtils::readSome(masterFd, buf, sizeof(buf));
    if (n > 0) {
      screen->write(buf, n);
      if (consoleOpen) {
        try {
          console->write(string(buf, n));
        } catch (const std::runtime_error& re) {
          // Keep capturing even if nobody is watching any more
          LOG(WARNING) << "Console output closed: " << re.what();
          consoleOpen = false;
        }
      }
    } else if (n == 0) {
      VLOG(1) << "pty reached EOF";
      break;
    } else {
      int readErrno = GetErrno();
      if (readErrno == EAGAIN || readErrno == EWOULDBLOCK) {
        continue;
      }
      if (RawFdUtils::isEndOfSession(readErrno)) {
        VLOG(1) << "pty closed: " << strerror(readErrno);
      } else {
        LOG(WARNING) << "pty read error: " << strerror(readErrno);
      }
      break;
    }
  }
}

void TerminalSession::fillExitStatus(int status, CaptureResult* result) {
  if (WIFEXITED(status)) {
    int exitCode = WEXITSTATUS(status);
    result->set_exit_code(exitCode);
    if (exitCode == 0) {
      result->set_error_type(NO_ERROR);
    } else {
      result->set_error_type(RUNTIME_ERROR);
      result->set_error("exit status " + to_string(exitCode));
    }
  } else if (WIFSIGNALED(status)) {
    int signum = WTERMSIG(status);
    result->set_term_signal(signum);
    result->set_error_type(RUNTIME_ERROR);
    result->set_error(string("signal: ") + strsignal(signum));
  } else {
    result->set_error_type(RUNTIME_ERROR);
    result->set_error("unexpected wait status " + to_string(status));
  }
}

winsize TerminalSession::toWinsize(const TerminalInfo& ti) {
  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(tmpwin));
  tmpwin.ws_row = ti.row();
  tmpwin.ws_col = ti.column();
  tmpwin.ws_xpixel = ti.width();
  tmpwin.ws_ypixel = ti.height();
  return tmpwin;
}
}  // namespace capterm
