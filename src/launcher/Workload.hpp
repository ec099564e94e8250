#ifndef __CM_WORKLOAD_H__
#define __CM_WORKLOAD_H__

#include "Headers.hpp"
#include "IpcErrors.hpp"

namespace cm {
/**
 * @brief A request that reached the running instance, either from its own
 * command line or from a later launch.
 */
struct AppLaunchEvent {
  enum EventType {
    OPEN_FILE,
    REVEAL_APP,
  };

  EventType type;
  vector<string> paths;
};

inline std::ostream& operator<<(std::ostream& os,
                                const AppLaunchEvent& event) {
  switch (event.type) {
    case AppLaunchEvent::OPEN_FILE:
      os << "OPEN_FILE(" << event.paths.size() << " paths)";
      break;
    case AppLaunchEvent::REVEAL_APP:
      os << "REVEAL_APP";
      break;
  }
  return os;
}

/**
 * @brief Callbacks the launcher hands to the workload.
 */
struct LifecycleHooks {
  /** @brief Called once the workload is up and able to process events. */
  function<void()> onReady;
  /** @brief Called when the workload is about to return from run(). */
  function<void()> onTerminate;
};

/**
 * @brief The application proper, run by the instance that owns the IPC
 * endpoint.
 */
class Workload {
 public:
  virtual ~Workload() {}

  /**
   * @brief Runs until the application quits.
   * @throws WorkloadError (or any std::exception) when the application fails.
   */
  virtual void run(const LifecycleHooks& hooks) = 0;

  /**
   * @brief Queues an event for the workload.  Called from the IPC accept loop
   * as well as the main thread, so implementations must be thread-safe.
   * @return false when the event could not be queued.
   */
  virtual bool enqueueLaunchEvent(const AppLaunchEvent& event) = 0;
};
}  // namespace cm

#endif  // __CM_WORKLOAD_H__
