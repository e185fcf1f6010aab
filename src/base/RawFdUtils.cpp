#include "RawFdUtils.hpp"

namespace capterm {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      VLOG(1) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to fd: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: fd closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

bool RawFdUtils::writeAllUntilWoken(int fd, const char* buf, size_t count,
                                    int wakeFd) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAllUntilWoken");
  }

  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc > 0) {
      bytesWritten += rc;
      continue;
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: fd closed");
    }
    auto localErrno = GetErrno();
    if (localErrno == EINTR) {
      continue;
    }
    if (localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
      VLOG(1) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to fd: ") +
                               strerror(localErrno));
    }

    // Full: wait for the reader or for someone to call us off
    pollfd fds[2];
    fds[0].fd = fd;
    fds[0].events = POLLOUT;
    fds[0].revents = 0;
    fds[1].fd = wakeFd;
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    int pollRc = ::poll(fds, 2, -1);
    if (pollRc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      throw std::runtime_error(string("poll failed: ") +
                               strerror(GetErrno()));
    }
    if (fds[1].revents & (POLLIN | POLLHUP)) {
      VLOG(1) << "Write to fd " << fd << " abandoned with "
              << (count - bytesWritten) << " bytes left";
      return false;
    }
  }
  return true;
}

ssize_t RawFdUtils::readSome(int fd, char* buf, size_t count) {
  while (true) {
    ssize_t rc = ::read(fd, buf, count);
    if (rc < 0 && GetErrno() == EINTR) {
      continue;
    }
    return rc;
  }
}

bool RawFdUtils::isEndOfSession(int readErrno) {
  // Linux reports EIO on the master once every slave fd is closed.
  return readErrno == EIO || readErrno == EBADF || readErrno == ENXIO;
}
}  // namespace capterm
