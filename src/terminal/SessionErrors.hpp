#ifndef __CAPTERM_SESSION_ERRORS_HPP__
#define __CAPTERM_SESSION_ERRORS_HPP__

#include "Headers.hpp"

namespace capterm {
/**
 * @brief Raised when a command could not be started or attached to the
 * terminal: empty command line, pty/spawn failure, terminal size or raw mode
 * failure.  No capture exists when this is thrown.
 */
class SetupError : public std::runtime_error {
 public:
  explicit SetupError(const string& what) : std::runtime_error(what) {}
};
}  // namespace capterm

#endif  // __CAPTERM_SESSION_ERRORS_HPP__
