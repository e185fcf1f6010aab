#ifndef __CAPTERM_USER_TERMINAL_HPP__
#define __CAPTERM_USER_TERMINAL_HPP__

#include "Headers.hpp"

namespace capterm {
/**
 * @brief A child process attached to the slave side of a pseudo-terminal,
 * observed through the master fd.
 */
class UserTerminal {
 public:
  virtual ~UserTerminal() {}

  /**
   * @brief Spawns `args[0]` with `args` as its argv on a fresh terminal.
   * Throws SetupError if the terminal cannot be allocated or the program
   * cannot be executed.
   * @returns The master fd.
   */
  virtual int setup(const vector<string>& args) = 0;
  /**
   * @brief Blocks until the child exits and reaps it.
   * @returns The raw wait status.
   */
  virtual int waitForExit() = 0;
  /** @brief Sends `signal` to the child if it is still running.  Callable
   * from any thread. */
  virtual void terminate(int signal) = 0;
  /** @brief Kills and reaps a child that is still around and closes the
   * master fd.  Safe to call more than once. */
  virtual void cleanup() = 0;
  /** @brief Returns the master fd, or -1 once cleaned up. */
  virtual int getFd() = 0;
  /**
   * @brief Applies a window size to the terminal.
   */
  virtual void setInfo(const winsize& tmpwin) = 0;
};
}  // namespace capterm

#endif  // __CAPTERM_USER_TERMINAL_HPP__
