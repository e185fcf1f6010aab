#ifndef __CAPTERM_RAW_FD_UTILS__
#define __CAPTERM_RAW_FD_UTILS__

#include "Headers.hpp"

namespace capterm {
/**
 * @brief Blocking helpers around POSIX read/write on terminal and pipe fds.
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN and EINTR.  Throws std::runtime_error if the fd is gone.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Like writeAll, but for a non-blocking `fd`: while the fd is full it
   * waits for room or for `wakeFd` to become readable, whichever is first.
   * @return true once everything is written, false if woken before that.
   * Throws std::runtime_error if the fd is gone.
   */
  static bool writeAllUntilWoken(int fd, const char* buf, size_t count,
                                 int wakeFd);

  /**
   * @brief Reads whatever is available (up to `count` bytes), retrying on
   * EINTR.
   * @return Bytes read, 0 on end of stream, -1 on error with errno set.
   */
  static ssize_t readSome(int fd, char* buf, size_t count);

  /** @brief True when an errno from a pty master read means the slave side
   * has gone away. */
  static bool isEndOfSession(int readErrno);
};
}  // namespace capterm
#endif  // __CAPTERM_RAW_FD_UTILS__
