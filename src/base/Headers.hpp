#ifndef __CAPTERM_HEADERS__
#define __CAPTERM_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#if __APPLE__
#include <sys/ucred.h>
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#elif __NetBSD__  // do not need pty.h on NetBSD
#include <util.h>
#else
#include <pty.h>
#endif

#include <paths.h>
#include <poll.h>
#include <pthread.h>
#include <pwd.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <functional>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

#include "CapTerm.pb.h"
#include "easylogging++.h"
#include "ust.hpp"

using namespace std;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef CAPTERM_VERSION
#define CAPTERM_VERSION "unknown"
#endif

namespace capterm {
// Used when the controlling terminal reports a zero-sized window.
const int DEFAULT_TERMINAL_ROWS = 24;
const int DEFAULT_TERMINAL_COLUMNS = 80;

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

/**
 * @brief Splits on runs of whitespace.  No quoting or escaping is honored, so
 * "a 'b c'" yields three tokens.
 */
inline std::vector<std::string> splitOnWhitespace(const std::string &s) {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : s) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) {
        tokens.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

inline std::string trimRight(const std::string &s, const char *chars) {
  auto end = s.find_last_not_of(chars);
  if (end == std::string::npos) {
    return "";
  }
  return s.substr(0, end + 1);
}

inline bool isBlank(const std::string &s) {
  return std::all_of(s.begin(), s.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
}

inline std::string join(const std::vector<std::string> &elems,
                        const std::string &delim) {
  std::string retval;
  for (size_t a = 0; a < elems.size(); a++) {
    if (a) {
      retval += delim;
    }
    retval += elems[a];
  }
  return retval;
}

/** @brief Creates a pipe whose ends are not inherited across exec. */
inline void createCloexecPipe(int fds[2]) {
  FATAL_FAIL(::pipe(fds));
  FATAL_FAIL(::fcntl(fds[0], F_SETFD, FD_CLOEXEC));
  FATAL_FAIL(::fcntl(fds[1], F_SETFD, FD_CLOEXEC));
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace capterm

#endif
