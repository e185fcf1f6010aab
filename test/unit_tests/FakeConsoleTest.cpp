#include "FakeConsole.hpp"
#include "TestHeaders.hpp"

namespace capterm {
TEST_CASE("FakeConsoleTest", "[FakeConsoleTest]") {
  shared_ptr<FakeConsole> fakeConsole(new FakeConsole(30, 100));

  TerminalInfo ti = fakeConsole->getTerminalInfo();
  REQUIRE(ti.row() == 30);
  REQUIRE(ti.column() == 100);
  REQUIRE(fakeConsole->getGetTerminalInfoCount() == 1);

  fakeConsole->setup();
  REQUIRE(fakeConsole->isRaw());

  string s(64 * 1024, '\0');
  for (int a = 0; a < 64 * 1024 - 1; a++) {
    s[a] = rand() % 26 + 'A';
  }
  s[64 * 1024 - 1] = 0;

  // More than a pipe buffer, so the writer has to wait for the reader
  thread t([fakeConsole, s]() { fakeConsole->simulateKeystrokes(s); });

  string s2(s.length(), '\0');
  size_t bytesRead = 0;
  while (bytesRead < s2.length()) {
    ssize_t rc = RawFdUtils::readSome(fakeConsole->getInputFd(),
                                      &s2[bytesRead], s2.length() - bytesRead);
    REQUIRE(rc > 0);
    bytesRead += rc;
  }
  t.join();
  REQUIRE(s == s2);

  fakeConsole->write(s);
  REQUIRE(fakeConsole->getTerminalData() == s);

  fakeConsole->teardown();
  fakeConsole->teardown();
  REQUIRE(!fakeConsole->isRaw());
  REQUIRE(fakeConsole->getSetupCount() == 1);
  REQUIRE(fakeConsole->getTeardownCount() == 1);

  fakeConsole->closeInput();
  char c;
  REQUIRE(RawFdUtils::readSome(fakeConsole->getInputFd(), &c, 1) == 0);
}

TEST_CASE("FakeConsole failure switches", "[FakeConsoleTest]") {
  FakeConsole fakeConsole;

  fakeConsole.setFailTerminalInfo(true);
  REQUIRE_THROWS_AS(fakeConsole.getTerminalInfo(), SetupError);
  fakeConsole.setFailTerminalInfo(false);
  fakeConsole.resize(50, 132);
  REQUIRE(fakeConsole.getTerminalInfo().row() == 50);
  REQUIRE(fakeConsole.getTerminalInfo().column() == 132);

  fakeConsole.setFailSetup(true);
  REQUIRE_THROWS_AS(fakeConsole.setup(), SetupError);
  REQUIRE(!fakeConsole.isRaw());
  REQUIRE(fakeConsole.getSetupCount() == 0);
}
}  // namespace capterm
