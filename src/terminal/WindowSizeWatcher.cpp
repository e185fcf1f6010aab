#include "WindowSizeWatcher.hpp"

namespace capterm {
namespace {
// Slot pipes are created on first use and never closed: the signal handler
// may still be holding a write fd when a watcher deregisters, and a stray
// byte in an idle pipe is drained by the next owner.
std::atomic<int> slotWriteFds[WindowSizeWatcher::MAX_WATCHERS];
std::atomic<bool> slotActive[WindowSizeWatcher::MAX_WATCHERS];
int slotReadFds[WindowSizeWatcher::MAX_WATCHERS];
bool slotsInitialized = false;

std::mutex registryMutex;
int activeWatchers = 0;
struct sigaction previousWinchAction;

void initSlotsLocked() {
  if (slotsInitialized) {
    return;
  }
  for (int a = 0; a < WindowSizeWatcher::MAX_WATCHERS; a++) {
    slotWriteFds[a] = -1;
    slotActive[a] = false;
    slotReadFds[a] = -1;
  }
  slotsInitialized = true;
}

void drainFd(int fd) {
  char buf[64];
  while (true) {
    ssize_t rc = ::read(fd, buf, sizeof(buf));
    if (rc > 0) {
      continue;
    }
    if (rc < 0 && GetErrno() == EINTR) {
      continue;
    }
    break;
  }
}
}  // namespace

const int WindowSizeWatcher::MAX_WATCHERS;

WindowSizeWatcher::WindowSizeWatcher(std::function<void()> _onResize)
    : onResize(_onResize), slot(-1), stopping(false) {}

WindowSizeWatcher::~WindowSizeWatcher() { stop(); }

void WindowSizeWatcher::handleWinch(int signum, siginfo_t* info,
                                     void* context) {
  int savedErrno = errno;
  for (int a = 0; a < MAX_WATCHERS; a++) {
    if (!slotActive[a]) {
      continue;
    }
    int fd = slotWriteFds[a];
    if (fd >= 0) {
      char c = 'W';
      ssize_t ignored = ::write(fd, &c, 1);
      (void)ignored;
    }
  }
  errno = savedErrno;

  // Whoever handled SIGWINCH before us still gets every notification.
  if (previousWinchAction.sa_flags & SA_SIGINFO) {
    if (previousWinchAction.sa_sigaction) {
      previousWinchAction.sa_sigaction(signum, info, context);
    }
  } else if (previousWinchAction.sa_handler != SIG_DFL &&
             previousWinchAction.sa_handler != SIG_IGN) {
    previousWinchAction.sa_handler(signum);
  }
  errno = savedErrno;
}

void WindowSizeWatcher::start() {
  if (slot >= 0) {
    return;
  }
  lock_guard<std::mutex> guard(registryMutex);
  initSlotsLocked();
  int freeSlot = -1;
  for (int a = 0; a < MAX_WATCHERS; a++) {
    if (!slotActive[a]) {
      freeSlot = a;
      break;
    }
  }
  if (freeSlot == -1) {
    throw std::runtime_error("Too many active window size watchers");
  }

  if (slotReadFds[freeSlot] == -1) {
    int fds[2];
    createCloexecPipe(fds);
    FATAL_FAIL(::fcntl(fds[0], F_SETFL, O_NONBLOCK));
    FATAL_FAIL(::fcntl(fds[1], F_SETFL, O_NONBLOCK));
    slotReadFds[freeSlot] = fds[0];
    slotWriteFds[freeSlot] = fds[1];
  }
  drainFd(slotReadFds[freeSlot]);

  if (activeWatchers == 0) {
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_sigaction = WindowSizeWatcher::handleWinch;
    sigemptyset(&act.sa_mask);
    act.sa_flags = SA_RESTART | SA_SIGINFO;
    FATAL_FAIL(sigaction(SIGWINCH, &act, &previousWinchAction));
  }
  activeWatchers++;
  slotActive[freeSlot] = true;
  slot = freeSlot;
  stopping = false;
  VLOG(1) << "Window size watcher registered in slot " << slot;

  watchThread = std::thread(&WindowSizeWatcher::run, this);
}

void WindowSizeWatcher::stop() {
  if (slot < 0) {
    return;
  }
  stopping = true;
  {
    // Wake the thread through its own pipe
    char c = 'S';
    ssize_t ignored = ::write(slotWriteFds[slot], &c, 1);
    (void)ignored;
  }
  if (watchThread.joinable()) {
    watchThread.join();
  }

  lock_guard<std::mutex> guard(registryMutex);
  slotActive[slot] = false;
  activeWatchers--;
  if (activeWatchers == 0) {
    FATAL_FAIL(sigaction(SIGWINCH, &previousWinchAction, NULL));
  }
  VLOG(1) << "Window size watcher released slot " << slot;
  slot = -1;
}

int WindowSizeWatcher::getActiveCount() {
  lock_guard<std::mutex> guard(registryMutex);
  return activeWatchers;
}

void WindowSizeWatcher::run() {
  el::Helpers::setThreadName("resize-watcher");
  int readFd = slotReadFds[slot];
  while (true) {
    pollfd pfd;
    pfd.fd = readFd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, -1);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      STERROR << "poll on resize pipe failed: " << strerror(GetErrno());
      break;
    }
    drainFd(readFd);
    if (stopping) {
      break;
    }
    VLOG(2) << "Got SIGWINCH";
    try {
      onResize();
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Could not apply window size: " << ex.what();
    }
  }
}
}  // namespace capterm
