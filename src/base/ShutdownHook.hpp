#ifndef __CM_SHUTDOWN_HOOK__
#define __CM_SHUTDOWN_HOOK__

#include "Headers.hpp"

namespace cm {
/**
 * @brief Ordered list of cleanup callbacks that run once when the process
 * ends.
 *
 * Callbacks run in registration order, either when runHooks() is called on
 * the normal exit path or, if the process leaves through exit() before that,
 * from an atexit() handler.  A hook that throws is logged and the remaining
 * hooks still run.
 */
class ShutdownHook {
 public:
  ShutdownHook();
  ~ShutdownHook();

  /** @brief Registers a no-argument cleanup callback. */
  void runOnShutdown(function<void()> hook);

  /** @brief Runs every registered hook.  Later calls do nothing. */
  void runHooks();

  inline bool hasRun() {
    lock_guard<std::mutex> guard(hookMutex);
    return ran;
  }

  /**
   * @brief Makes this instance the one whose hooks run from atexit().
   * Only one instance can be installed at a time.
   */
  void installAtExit();

 protected:
  static void runInstalledHooks();

  vector<function<void()>> hooks;
  bool ran;
  std::mutex hookMutex;

  static ShutdownHook* installed;
  static std::mutex installedMutex;
};
}  // namespace cm

#endif  // __CM_SHUTDOWN_HOOK__
