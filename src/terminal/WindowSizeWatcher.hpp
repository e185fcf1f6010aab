#ifndef __CAPTERM_WINDOW_SIZE_WATCHER_HPP__
#define __CAPTERM_WINDOW_SIZE_WATCHER_HPP__

#include "Headers.hpp"

namespace capterm {
/**
 * @brief Scoped SIGWINCH subscription.
 *
 * start() claims a slot in a process-wide table of self-pipes and spawns a
 * thread that calls `onResize` each time the window changes.  The SIGWINCH
 * handler is installed by the first active watcher and the previous
 * disposition is put back when the last one stops, so independent sessions
 * can each hold their own watcher.  A handler the host had installed keeps
 * being called while watchers are active.
 */
class WindowSizeWatcher {
 public:
  static const int MAX_WATCHERS = 16;

  explicit WindowSizeWatcher(std::function<void()> _onResize);
  ~WindowSizeWatcher();

  /** @brief Registers for SIGWINCH.  Throws std::runtime_error when every
   * slot is taken. */
  void start();
  /** @brief Deregisters and joins the watcher thread.  Idempotent. */
  void stop();

  bool isActive() const { return slot >= 0; }

  /** @brief Number of watchers currently registered in this process. */
  static int getActiveCount();

 protected:
  /** @brief Wakes every active slot, then chains to the handler that was
   * installed before the first watcher started. */
  static void handleWinch(int signum, siginfo_t* info, void* context);
  void run();

  std::function<void()> onResize;
  int slot;
  std::atomic<bool> stopping;
  std::thread watchThread;
};
}  // namespace capterm

#endif  // __CAPTERM_WINDOW_SIZE_WATCHER_HPP__
