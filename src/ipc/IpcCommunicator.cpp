#include "IpcCommunicator.hpp"

#include "IpcClientCommunicator.hpp"
#include "IpcServerCommunicator.hpp"

namespace cm {
namespace {
// How long a process that lost the bind race keeps trying to reach the
// winner, which may still be between taking the lock and calling listen().
const std::chrono::milliseconds ROLE_RACE_WINDOW(500);
const std::chrono::milliseconds ROLE_RACE_RETRY_INTERVAL(20);

bool nothingListening(int error) {
  return error == ENOENT || error == ECONNREFUSED;
}

string describeFailure(const SocketEndpoint& endpoint, const string& step,
                       int error) {
  ostringstream oss;
  oss << endpoint << ": " << step << " failed (" << strerror(error) << ")";
  return oss.str();
}
}  // namespace

IpcCommunicator::IpcCommunicator(shared_ptr<PipeSocketHandler> _socketHandler)
    : socketHandler(_socketHandler), closed(false) {}

shared_ptr<IpcCommunicator> IpcCommunicator::create(
    shared_ptr<PipeSocketHandler> socketHandler,
    const vector<SocketEndpoint>& candidates) {
  if (candidates.empty()) {
    LOG(WARNING) << "No IPC socket paths configured, other instances will not "
                    "be able to reach this one";
    return shared_ptr<IpcCommunicator>(
        new IpcServerCommunicator(socketHandler));
  }

  vector<string> failures;
  for (const auto& endpoint : candidates) {
    auto communicator = tryEndpoint(socketHandler, endpoint, &failures);
    if (communicator) {
      return communicator;
    }
  }

  string message = "Failed to establish IPC on any socket path";
  for (const auto& failure : failures) {
    message += "\n  " + failure;
  }
  LOG(ERROR) << message;
  throw EndpointError(message);
}

shared_ptr<IpcCommunicator> IpcCommunicator::tryEndpoint(
    shared_ptr<PipeSocketHandler> socketHandler,
    const SocketEndpoint& endpoint, vector<string>* failures) {
  VLOG(1) << "Trying IPC socket " << endpoint;
  int fd = socketHandler->connect(endpoint);
  if (fd >= 0) {
    LOG(INFO) << "Connected to running instance on " << endpoint;
    return shared_ptr<IpcCommunicator>(
        new IpcClientCommunicator(socketHandler, endpoint, fd));
  }
  int connectErrno = GetErrno();
  if (!nothingListening(connectErrno)) {
    LOG(INFO) << "Skipping " << endpoint << ": " << strerror(connectErrno);
    failures->push_back(describeFailure(endpoint, "connect", connectErrno));
    return nullptr;
  }

  auto deadline = std::chrono::steady_clock::now() + ROLE_RACE_WINDOW;
  while (true) {
    set<int> serverFds = socketHandler->listen(endpoint);
    if (!serverFds.empty()) {
      LOG(INFO) << "No running instance found, serving IPC on " << endpoint;
      return shared_ptr<IpcCommunicator>(new IpcServerCommunicator(
          socketHandler, endpoint, *(serverFds.begin())));
    }
    int listenErrno = GetErrno();
    if (listenErrno != EADDRINUSE) {
      LOG(INFO) << "Skipping " << endpoint << ": " << strerror(listenErrno);
      failures->push_back(describeFailure(endpoint, "listen", listenErrno));
      return nullptr;
    }

    // Someone else holds the path.  They might not be accepting yet.
    fd = socketHandler->connect(endpoint);
    if (fd >= 0) {
      LOG(INFO) << "Connected to running instance on " << endpoint;
      return shared_ptr<IpcCommunicator>(
          new IpcClientCommunicator(socketHandler, endpoint, fd));
    }
    connectErrno = GetErrno();
    if (!nothingListening(connectErrno)) {
      failures->push_back(describeFailure(endpoint, "connect", connectErrno));
      return nullptr;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      LOG(INFO) << endpoint << " is held by another process that does not "
                                "accept connections";
      failures->push_back(describeFailure(endpoint, "connect", connectErrno));
      return nullptr;
    }
    std::this_thread::sleep_for(ROLE_RACE_RETRY_INTERVAL);
  }
}

void IpcCommunicator::sendHandleLaunchArgs(const vector<string>& args) {
  checkOpen("sendHandleLaunchArgs");
  throw RoleError("sendHandleLaunchArgs requires the client role");
}

void IpcCommunicator::sendRevealRunningApp() {
  checkOpen("sendRevealRunningApp");
  throw RoleError("sendRevealRunningApp requires the client role");
}

void IpcCommunicator::listen(shared_ptr<IpcMessageListener> listener,
                             shared_ptr<ThreadPool> runner) {
  checkOpen("listen");
  throw RoleError("listen requires the server role");
}

void IpcCommunicator::close() {
  lock_guard<std::mutex> guard(stateMutex);
  if (closed) {
    VLOG(1) << "IPC communicator already closed";
    return;
  }
  closed = true;
  closeEndpoint();
}

void IpcCommunicator::closeUnchecked() {
  try {
    close();
  } catch (const std::exception& e) {
    LOG(ERROR) << "Failed to close IPC communicator: " << e.what();
  }
}

void IpcCommunicator::checkOpen(const string& operation) {
  lock_guard<std::mutex> guard(stateMutex);
  if (closed) {
    throw RoleError(operation + " called on a closed IPC communicator");
  }
}
}  // namespace cm
