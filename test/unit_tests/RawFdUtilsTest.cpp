#include "RawFdUtils.hpp"
#include "TestHeaders.hpp"

using namespace capterm;

TEST_CASE("RawFdUtils writeAll writes all data", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  const string payload = "test data for writeAll";
  RawFdUtils::writeAll(fds[1], payload.data(), payload.size());
  ::close(fds[1]);

  string buffer(payload.size() + 1, '\0');
  ssize_t n = RawFdUtils::readSome(fds[0], &buffer[0], buffer.size());
  REQUIRE(n == static_cast<ssize_t>(payload.size()));
  buffer.resize(n);
  REQUIRE(buffer == payload);
  REQUIRE(RawFdUtils::readSome(fds[0], &buffer[0], buffer.size()) == 0);
  ::close(fds[0]);
}

TEST_CASE("RawFdUtils writeAll throws on a closed pipe", "[RawFdUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  ::close(fds[0]);

  const string payload = "test data";
  REQUIRE_THROWS_AS(
      RawFdUtils::writeAll(fds[1], payload.data(), payload.size()),
      std::runtime_error);
  REQUIRE_THROWS_AS(RawFdUtils::writeAll(-1, payload.data(), payload.size()),
                    std::runtime_error);
  ::close(fds[1]);
}

TEST_CASE("RawFdUtils writeAllUntilWoken", "[RawFdUtils]") {
  int dataFds[2];
  int wakeFds[2];
  REQUIRE(::pipe(dataFds) == 0);
  REQUIRE(::pipe(wakeFds) == 0);
  REQUIRE(::fcntl(dataFds[1], F_SETFL, O_NONBLOCK) == 0);

  SECTION("Finishes once the reader catches up") {
    string payload(1024 * 1024, 'x');
    std::atomic<bool> finished(false);
    std::thread reader([&dataFds, &payload, &finished]() {
      string received;
      char buf[4096];
      while (received.size() < payload.size()) {
        ssize_t n = RawFdUtils::readSome(dataFds[0], buf, sizeof(buf));
        if (n <= 0) {
          break;
        }
        received.append(buf, n);
      }
      finished = (received == payload);
    });

    REQUIRE(RawFdUtils::writeAllUntilWoken(dataFds[1], payload.data(),
                                           payload.size(), wakeFds[0]));
    reader.join();
    REQUIRE(finished);
  }

  SECTION("Gives up when woken while nobody reads") {
    // Far more than a pipe buffer, and the read end is never drained
    string payload(1024 * 1024, 'y');
    std::atomic<int> outcome(-1);
    std::thread writer([&dataFds, &wakeFds, &payload, &outcome]() {
      outcome = RawFdUtils::writeAllUntilWoken(dataFds[1], payload.data(),
                                               payload.size(), wakeFds[0])
                    ? 1
                    : 0;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(outcome == -1);

    char c = 'X';
    REQUIRE(::write(wakeFds[1], &c, 1) == 1);
    writer.join();
    REQUIRE(outcome == 0);
  }

  SECTION("Throws when the reader is gone") {
    ::close(dataFds[0]);
    dataFds[0] = -1;
    const string payload = "nobody listens";
    REQUIRE_THROWS_AS(
        RawFdUtils::writeAllUntilWoken(dataFds[1], payload.data(),
                                       payload.size(), wakeFds[0]),
        std::runtime_error);
  }

  if (dataFds[0] >= 0) {
    ::close(dataFds[0]);
  }
  ::close(dataFds[1]);
  ::close(wakeFds[0]);
  ::close(wakeFds[1]);
}

TEST_CASE("RawFdUtils isEndOfSession", "[RawFdUtils]") {
  REQUIRE(RawFdUtils::isEndOfSession(EIO));
  REQUIRE(RawFdUtils::isEndOfSession(EBADF));
  REQUIRE_FALSE(RawFdUtils::isEndOfSession(EAGAIN));
  REQUIRE_FALSE(RawFdUtils::isEndOfSession(EINTR));
}
