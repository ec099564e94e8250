#include "IpcServerCommunicator.hpp"

namespace cm {
namespace {
// The accept loop checks for a halt request at least this often
const int64_t ACCEPT_POLL_INTERVAL_US = 100 * 1000;
// Same bound as a stalled frame transfer in SocketHandler
const std::chrono::milliseconds DEFAULT_CONNECTION_IDLE_TIMEOUT(10 * 1000);
}  // namespace

IpcServerCommunicator::IpcServerCommunicator(
    shared_ptr<PipeSocketHandler> _socketHandler,
    const SocketEndpoint& _endpoint, int _serverFd)
    : IpcCommunicator(_socketHandler),
      endpoint(_endpoint),
      serverFd(_serverFd),
      listening(false),
      halt(false),
      connectionIdleTimeout(DEFAULT_CONNECTION_IDLE_TIMEOUT),
      listenerThreadId(std::thread::id()) {}

IpcServerCommunicator::IpcServerCommunicator(
    shared_ptr<PipeSocketHandler> _socketHandler)
    : IpcCommunicator(_socketHandler),
      serverFd(-1),
      listening(false),
      halt(false),
      connectionIdleTimeout(DEFAULT_CONNECTION_IDLE_TIMEOUT),
      listenerThreadId(std::thread::id()) {}

IpcServerCommunicator::~IpcServerCommunicator() { closeUnchecked(); }

void IpcServerCommunicator::listen(shared_ptr<IpcMessageListener> listener,
                                   shared_ptr<ThreadPool> runner) {
  lock_guard<std::mutex> guard(stateMutex);
  if (closed) {
    throw RoleError("listen called on a closed IPC communicator");
  }
  if (listening) {
    throw RoleError("IPC server is already listening");
  }
  listening = true;
  if (!endpoint) {
    LOG(INFO) << "IPC is disabled, not listening for other instances";
    return;
  }
  listenerFuture =
      runner->enqueue([this, listener]() { acceptLoop(listener); });
}

void IpcServerCommunicator::acceptLoop(
    shared_ptr<IpcMessageListener> listener) {
  el::Helpers::setThreadName("ipc-listener");
  listenerThreadId = std::this_thread::get_id();
  LOG(INFO) << "Waiting for other instances on " << *endpoint;

  // Open connection -> time of its last complete frame (or of the accept)
  map<int, std::chrono::steady_clock::time_point> connections;
  while (!halt) {
    fd_set rfds;
    FD_ZERO(&rfds);
    int maxFd = -1;
    if (connections.size() < MAX_CONNECTIONS) {
      FD_SET(serverFd, &rfds);
      maxFd = serverFd;
    }
    for (const auto& it : connections) {
      FD_SET(it.first, &rfds);
      maxFd = max(maxFd, it.first);
    }

    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = ACCEPT_POLL_INTERVAL_US;
    int numFdsSet = select(maxFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet == -1) {
      if (GetErrno() != EINTR) {
        STERROR << "select() on IPC connections failed: "
                << strerror(GetErrno());
      }
      continue;
    }
    if (halt) {
      break;
    }

    auto now = std::chrono::steady_clock::now();
    for (auto it = connections.begin(); it != connections.end();) {
      int clientFd = it->first;
      bool keep;
      if (numFdsSet > 0 && FD_ISSET(clientFd, &rfds)) {
        keep = handleFrame(clientFd, listener);
        it->second = std::chrono::steady_clock::now();
      } else {
        keep = now - it->second < connectionIdleTimeout;
        if (!keep) {
          LOG(WARNING) << "Dropping idle IPC connection " << clientFd;
        }
      }
      if (keep) {
        ++it;
      } else {
        socketHandler->close(clientFd);
        it = connections.erase(it);
      }
    }

    if (numFdsSet > 0 && FD_ISSET(serverFd, &rfds)) {
      int clientFd = socketHandler->accept(serverFd);
      if (clientFd >= 0) {
        VLOG(1) << "Accepted IPC connection " << clientFd;
        connections[clientFd] = std::chrono::steady_clock::now();
      }
    }
  }

  for (const auto& it : connections) {
    socketHandler->close(it.first);
  }
  LOG(INFO) << "Stopped waiting for other instances on " << *endpoint;
}

bool IpcServerCommunicator::handleFrame(
    int clientFd, shared_ptr<IpcMessageListener> listener) {
  Packet packet;
  try {
    if (!socketHandler->readPacket(clientFd, &packet, true)) {
      VLOG(1) << "IPC connection " << clientFd << " closed by peer";
      return false;
    }
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Dropping IPC connection " << clientFd << ": "
                 << re.what();
    return false;
  }

  optional<IpcMessage> message;
  try {
    message = IpcMessage::fromPacket(packet);
  } catch (const FrameDecodeError& fde) {
    LOG(WARNING) << "Dropping IPC connection " << clientFd
                 << " after a malformed frame: " << fde.what();
    return false;
  }

  VLOG(1) << "Received " << *message;
  try {
    listener->onMessage(*message);
  } catch (const std::exception& e) {
    STERROR << "Failed to handle " << *message << ": " << e.what();
  }
  return true;
}

void IpcServerCommunicator::closeEndpoint() {
  if (!endpoint) {
    VLOG(1) << "Unbound IPC server, nothing to release";
    return;
  }
  halt = true;
  if (listenerFuture.valid()) {
    if (listenerThreadId.load() == std::this_thread::get_id()) {
      LOG(WARNING) << "IPC server closed from its own accept loop";
    } else {
      listenerFuture.wait();
    }
  }
  socketHandler->stopListening(*endpoint);
  serverFd = -1;
}
}  // namespace cm
