#include "IpcClientCommunicator.hpp"

namespace cm {
IpcClientCommunicator::IpcClientCommunicator(
    shared_ptr<PipeSocketHandler> _socketHandler,
    const SocketEndpoint& _endpoint, int _endpointFd)
    : IpcCommunicator(_socketHandler),
      endpoint(_endpoint),
      endpointFd(_endpointFd) {}

IpcClientCommunicator::~IpcClientCommunicator() { closeUnchecked(); }

void IpcClientCommunicator::sendHandleLaunchArgs(const vector<string>& args) {
  send(IpcMessage::handleLaunchArgs(args));
}

void IpcClientCommunicator::sendRevealRunningApp() {
  send(IpcMessage::revealRunningApp());
}

void IpcClientCommunicator::send(const IpcMessage& message) {
  lock_guard<std::mutex> guard(stateMutex);
  if (closed) {
    throw RoleError("Tried to send on a closed IPC communicator");
  }
  VLOG(1) << "Sending " << message << " to " << endpoint;
  socketHandler->writePacket(endpointFd, message.toPacket(), true);
}

void IpcClientCommunicator::closeEndpoint() {
  VLOG(1) << "Closing connection to " << endpoint;
  socketHandler->close(endpointFd);
  endpointFd = -1;
}
}  // namespace cm
