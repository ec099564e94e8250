#ifndef __CM_IPC_CLIENT_COMMUNICATOR_H__
#define __CM_IPC_CLIENT_COMMUNICATOR_H__

#include "IpcCommunicator.hpp"

namespace cm {
/**
 * @brief Connection to an already running instance.
 */
class IpcClientCommunicator : public IpcCommunicator {
 public:
  IpcClientCommunicator(shared_ptr<PipeSocketHandler> _socketHandler,
                        const SocketEndpoint& _endpoint, int _endpointFd);
  virtual ~IpcClientCommunicator();

  virtual bool isClient() const { return true; }

  virtual void sendHandleLaunchArgs(const vector<string>& args);
  virtual void sendRevealRunningApp();

  inline const SocketEndpoint& getEndpoint() const { return endpoint; }

 protected:
  virtual void closeEndpoint();
  void send(const IpcMessage& message);

  SocketEndpoint endpoint;
  int endpointFd;
};
}  // namespace cm

#endif  // __CM_IPC_CLIENT_COMMUNICATOR_H__
