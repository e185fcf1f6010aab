#include "PseudoTerminalConsole.hpp"
#include "PseudoUserTerminal.hpp"
#include "TerminalSession.hpp"
#include "TestHeaders.hpp"

using namespace capterm;

namespace {
bool sameMode(const termios& a, const termios& b) {
  return a.c_iflag == b.c_iflag && a.c_oflag == b.c_oflag &&
         a.c_cflag == b.c_cflag && a.c_lflag == b.c_lflag &&
         memcmp(a.c_cc, b.c_cc, sizeof(a.c_cc)) == 0;
}

/** @brief A pty pair standing in for the user's terminal. */
struct PtyPair {
  int master;
  int slave;

  PtyPair(int rows, int cols) {
    winsize win;
    memset(&win, 0, sizeof(win));
    win.ws_row = rows;
    win.ws_col = cols;
    FATAL_FAIL(openpty(&master, &slave, NULL, NULL, &win));
  }
  ~PtyPair() {
    ::close(slave);
    ::close(master);
  }
};
}  // namespace

TEST_CASE("PseudoTerminalConsole reads the window size",
          "[PseudoTerminalConsole]") {
  PtyPair pty(40, 120);
  PseudoTerminalConsole console(pty.slave, pty.slave);

  TerminalInfo ti = console.getTerminalInfo();
  REQUIRE(ti.row() == 40);
  REQUIRE(ti.column() == 120);
  REQUIRE(console.getFd() == pty.slave);
  REQUIRE(console.getInputFd() == pty.slave);
}

TEST_CASE("PseudoTerminalConsole raw mode round trip",
          "[PseudoTerminalConsole]") {
  PtyPair pty(24, 80);
  termios original;
  REQUIRE(tcgetattr(pty.slave, &original) == 0);
  REQUIRE((original.c_lflag & ICANON) != 0);

  {
    PseudoTerminalConsole console(pty.slave, pty.slave);
    console.setup();
    REQUIRE(console.isRaw());

    termios raw;
    REQUIRE(tcgetattr(pty.slave, &raw) == 0);
    REQUIRE((raw.c_lflag & ICANON) == 0);
    REQUIRE((raw.c_lflag & ECHO) == 0);

    console.teardown();
    REQUIRE(!console.isRaw());
    termios restored;
    REQUIRE(tcgetattr(pty.slave, &restored) == 0);
    REQUIRE(sameMode(original, restored));

    // Restoring again changes nothing
    console.teardown();
    REQUIRE(tcgetattr(pty.slave, &restored) == 0);
    REQUIRE(sameMode(original, restored));

    // Left raw on purpose, the destructor has to restore it
    console.setup();
  }

  termios afterDestructor;
  REQUIRE(tcgetattr(pty.slave, &afterDestructor) == 0);
  REQUIRE(sameMode(original, afterDestructor));
}

TEST_CASE("PseudoTerminalConsole needs a terminal", "[PseudoTerminalConsole]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  {
    PseudoTerminalConsole console(fds[0], fds[1]);
    REQUIRE_THROWS_AS(console.getTerminalInfo(), SetupError);
    REQUIRE_THROWS_AS(console.setup(), SetupError);
    REQUIRE(!console.isRaw());
  }
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("TerminalSession on a real terminal restores its mode",
          "[PseudoTerminalConsole][TerminalSession]") {
  PtyPair pty(24, 80);
  termios original;
  REQUIRE(tcgetattr(pty.slave, &original) == 0);

  shared_ptr<Console> console(new PseudoTerminalConsole(pty.slave, pty.slave));
  TerminalSession session(console, []() -> shared_ptr<UserTerminal> {
    return shared_ptr<UserTerminal>(new PseudoUserTerminal());
  });

  SECTION("After a successful run") {
    CaptureResult result = session.execute("echo on-a-tty");
    REQUIRE(result.error_type() == NO_ERROR);
    REQUIRE(result.output() == "on-a-tty");
  }

  SECTION("After a failed run") {
    CaptureResult result = session.execute("sh -c false");
    REQUIRE(result.error_type() == RUNTIME_ERROR);
  }

  termios restored;
  REQUIRE(tcgetattr(pty.slave, &restored) == 0);
  REQUIRE(sameMode(original, restored));
}
