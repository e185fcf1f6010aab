#ifndef __CAPTERM_PSEUDO_TERMINAL_CONSOLE_HPP__
#define __CAPTERM_PSEUDO_TERMINAL_CONSOLE_HPP__

#include "Console.hpp"
#include "SessionErrors.hpp"

namespace capterm {
/**
 * @brief The real controlling terminal: raw mode, window size and the stdio
 * descriptors.
 */
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole(int _inputFd = STDIN_FILENO,
                        int _outputFd = STDOUT_FILENO)
      : inputFd(_inputFd), outputFd(_outputFd), rawModeActive(false) {
    memset(&terminal_backup, 0, sizeof(struct termios));
  }

  virtual ~PseudoTerminalConsole() { teardown(); }

  /** @brief Switches the input terminal to raw mode. */
  virtual void setup() {
    if (rawModeActive) {
      return;
    }
    termios terminal_local;
    if (tcgetattr(inputFd, &terminal_local) == -1) {
      throw SetupError(string("Error reading terminal mode: ") +
                       strerror(GetErrno()));
    }
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    if (tcsetattr(inputFd, TCSANOW, &terminal_local) == -1) {
      throw SetupError(string("Error setting raw mode: ") +
                       strerror(GetErrno()));
    }
    rawModeActive = true;
    VLOG(1) << "Console in raw mode";
  }

  /** @brief Restores the terminal state saved in setup(). */
  virtual void teardown() {
    if (!rawModeActive) {
      return;
    }
    if (tcsetattr(inputFd, TCSANOW, &terminal_backup) == -1) {
      STERROR << "Error restoring terminal mode: " << strerror(GetErrno());
    }
    rawModeActive = false;
    VLOG(1) << "Console mode restored";
  }

  /** @brief Queries the current terminal window dimensions. */
  virtual TerminalInfo getTerminalInfo() {
    winsize win;
    if (ioctl(outputFd, TIOCGWINSZ, &win) == -1) {
      throw SetupError(string("Error getting terminal size: ") +
                       strerror(GetErrno()));
    }
    TerminalInfo ti;
    ti.set_row(win.ws_row);
    ti.set_column(win.ws_col);
    ti.set_width(win.ws_xpixel);
    ti.set_height(win.ws_ypixel);
    return ti;
  }

  virtual int getFd() { return outputFd; }

  virtual int getInputFd() { return inputFd; }

  bool isRaw() const { return rawModeActive; }

 protected:
  int inputFd;
  int outputFd;
  bool rawModeActive;
  /** @brief Backup of the terminal's `termios` state for teardown. */
  termios terminal_backup;
};
}  // namespace capterm

#endif  // __CAPTERM_PSEUDO_TERMINAL_CONSOLE_HPP__
