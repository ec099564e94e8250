#ifndef __CM_HEADLESS_WORKLOAD_H__
#define __CM_HEADLESS_WORKLOAD_H__

#include "Workload.hpp"

namespace cm {
/**
 * @brief Workload without a user interface.
 *
 * Reports launch events on the stdout logger and keeps the instance alive
 * until SIGINT/SIGTERM or requestStop().
 */
class HeadlessWorkload : public Workload {
 public:
  HeadlessWorkload();
  virtual ~HeadlessWorkload() {}

  virtual void run(const LifecycleHooks& hooks);
  virtual bool enqueueLaunchEvent(const AppLaunchEvent& event);

  /** @brief Makes run() return once the queued events are processed. */
  void requestStop();

  vector<string> getOpenedPaths();
  int getRevealCount();

  static constexpr size_t MAX_PENDING_EVENTS = 1000;

 protected:
  void processEvent(const AppLaunchEvent& event);

  std::mutex eventMutex;
  std::condition_variable eventCondition;
  deque<AppLaunchEvent> pendingEvents;
  bool stopRequested;
  vector<string> openedPaths;
  int revealCount;
};
}  // namespace cm

#endif  // __CM_HEADLESS_WORKLOAD_H__
