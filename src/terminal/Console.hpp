#ifndef __CAPTERM_CONSOLE_HPP__
#define __CAPTERM_CONSOLE_HPP__

#include "CapTerm.pb.h"
#include "Headers.hpp"
#include "RawFdUtils.hpp"

namespace capterm {
/**
 * @brief Abstract view of the terminal the user is sitting at.
 */
class Console {
 public:
  virtual ~Console() {}

  /**
   * @brief Returns the current window geometry.  Throws SetupError when the
   * size cannot be queried.
   */
  virtual TerminalInfo getTerminalInfo() = 0;
  /** @brief Saves the current mode and switches to raw mode.  Throws
   * SetupError on failure. */
  virtual void setup() = 0;
  /** @brief Restores the mode saved by setup().  Safe to call repeatedly. */
  virtual void teardown() = 0;
  /** @brief Descriptor that receives terminal output. */
  virtual int getFd() = 0;
  /** @brief Descriptor that produces keystrokes. */
  virtual int getInputFd() = 0;

  virtual void write(const string& s) {
    RawFdUtils::writeAll(getFd(), s.data(), s.length());
  }
};
}  // namespace capterm

#endif  // __CAPTERM_CONSOLE_HPP__
