#ifndef __CAPTERM_TERMINAL_SESSION_HPP__
#define __CAPTERM_TERMINAL_SESSION_HPP__

#include "CapTerm.pb.h"
#include "Console.hpp"
#include "Headers.hpp"
#include "ScreenBuffer.hpp"
#include "SessionErrors.hpp"
#include "UserTerminal.hpp"

namespace capterm {
/**
 * @brief Runs one command line at a time on a pty while mirroring it to the
 * console, and returns a plain-text rendering of the final screen.
 */
class TerminalSession {
 public:
  typedef std::function<shared_ptr<UserTerminal>()> UserTerminalFactory;

  /** @brief A session on the process' own stdin/stdout. */
  TerminalSession();
  TerminalSession(shared_ptr<Console> _console,
                  UserTerminalFactory _userTerminalFactory);

  /**
   * @brief Runs `commandLine` to completion.
   *
   * The line is split on whitespace only; the first word is the program and
   * the rest are passed through literally (no quoting, globbing, pipes or
   * redirects).  Blocks until the program exits.
   *
   * @returns The rendered screen plus error information.  `error_type` is
   * SETUP_ERROR (empty output) when nothing could be run and RUNTIME_ERROR
   * when the program exited non-zero or was killed.
   */
  CaptureResult execute(const string& commandLine);

  /** @brief Signals the program started by a running execute().  No-op when
   * idle. */
  void terminate(int signal = SIGTERM);

  bool isRunning();

 protected:
  void runSession(const vector<string>& args, CaptureResult* result);
  void inputRelay(int masterFd, int wakeFd);
  void outputRelay(int masterFd, int wakeFd, ScreenBuffer* screen);
  void setActiveTerminal(shared_ptr<UserTerminal> term);
  static void fillExitStatus(int status, CaptureResult* result);
  static winsize toWinsize(const TerminalInfo& ti);

  shared_ptr<Console> console;
  UserTerminalFactory userTerminalFactory;
  /** @brief One execute() at a time per session. */
  std::mutex executeMutex;
  std::mutex activeTerminalMutex;
  shared_ptr<UserTerminal> activeTerminal;
};
}  // namespace capterm

#endif  // __CAPTERM_TERMINAL_SESSION_HPP__
