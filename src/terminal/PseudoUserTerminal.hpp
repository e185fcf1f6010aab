#ifndef __CAPTERM_PSEUDO_USER_TERMINAL_HPP__
#define __CAPTERM_PSEUDO_USER_TERMINAL_HPP__

#include "UserTerminal.hpp"

namespace capterm {
/**
 * @brief Runs a command on a pty allocated with forkpty().
 */
class PseudoUserTerminal : public UserTerminal {
 public:
  PseudoUserTerminal();
  virtual ~PseudoUserTerminal();

  virtual int setup(const vector<string>& args);
  virtual int waitForExit();
  virtual void terminate(int signal);
  virtual void cleanup();
  virtual void setInfo(const winsize& tmpwin);

  virtual int getFd() { return masterFd; }

  pid_t getPid() { return pid; }

 protected:
  /** @brief Child half of setup().  Only async-signal-safe calls past fork. */
  static void runCommand(char* const* argv, int execErrorFd);

  /** @brief Guards `running` against terminate() racing the reap. */
  std::mutex childMutex;
  pid_t pid;
  bool running;
  int masterFd;
};
}  // namespace capterm

#endif  // __CAPTERM_PSEUDO_USER_TERMINAL_HPP__
