#ifndef __CM_IPC_MESSAGE_LISTENER_H__
#define __CM_IPC_MESSAGE_LISTENER_H__

#include "IpcMessage.hpp"

namespace cm {
/**
 * @brief Receives the messages decoded by a listening IpcCommunicator.
 *
 * Called from the accept loop thread, one message at a time and in the order
 * the messages arrived on a connection.
 */
class IpcMessageListener {
 public:
  virtual ~IpcMessageListener() {}

  virtual void onMessage(const IpcMessage& message) = 0;
};
}  // namespace cm

#endif  // __CM_IPC_MESSAGE_LISTENER_H__
