#ifndef __CAPTERM_TEST_HEADERS__
#define __CAPTERM_TEST_HEADERS__

#include "Headers.hpp"

#include <catch2/catch.hpp>

namespace capterm {
/** @brief Polls `condition` every 10ms until it holds or `timeoutMs` passes. */
inline bool waitFor(std::function<bool()> condition, int timeoutMs = 5000) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}
}  // namespace capterm

#endif  // __CAPTERM_TEST_HEADERS__
