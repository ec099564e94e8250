#ifndef __CM_IPC_MESSAGE_HANDLER_H__
#define __CM_IPC_MESSAGE_HANDLER_H__

#include "Headers.hpp"
#include "IpcMessageListener.hpp"
#include "Workload.hpp"

namespace cm {
/**
 * @brief Turns IPC messages into launch events for the workload.
 *
 * Only talks to the workload through Workload::enqueueLaunchEvent, so it can
 * be called from the accept loop while the workload runs on another thread.
 */
class IpcMessageHandler : public IpcMessageListener {
 public:
  explicit IpcMessageHandler(shared_ptr<Workload> _workload);
  virtual ~IpcMessageHandler() {}

  /**
   * @brief Queues an OPEN_FILE event for the arguments that look like paths.
   * Nothing is queued when no argument is left.
   */
  void handleLaunchArgs(const vector<string>& args);

  virtual void onMessage(const IpcMessage& message);

 protected:
  void enqueue(const AppLaunchEvent& event);

  shared_ptr<Workload> workload;
};
}  // namespace cm

#endif  // __CM_IPC_MESSAGE_HANDLER_H__
