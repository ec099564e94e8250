#include "PipeSocketHandler.hpp"

namespace cm {
PipeSocketHandler::PipeSocketHandler(std::chrono::milliseconds _connectTimeout)
    : connectTimeout(_connectTimeout) {}

string PipeSocketHandler::getLockPath(const string& pipePath) {
  return pipePath + ".lock";
}

bool PipeSocketHandler::fillSocketAddress(const string& pipePath,
                                          sockaddr_un* address) {
  memset(address, 0, sizeof(sockaddr_un));
  address->sun_family = AF_UNIX;
  if (pipePath.empty() || pipePath.length() >= sizeof(address->sun_path)) {
    return false;
  }
  strncpy(address->sun_path, pipePath.c_str(), sizeof(address->sun_path) - 1);
  return true;
}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  string pipePath = endpoint.name();
  sockaddr_un remote;
  if (!fillSocketAddress(pipePath, &remote)) {
    LOG(WARNING) << "Invalid socket path: " << endpoint;
    SetErrno(ENAMETOOLONG);
    return -1;
  }

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  auto deadline = std::chrono::steady_clock::now() + connectTimeout;
  int result;
  int localErrno;
  while (true) {
    result = ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
    localErrno = GetErrno();
    if (result == 0 || localErrno == EINPROGRESS || localErrno == EINTR) {
      break;
    }
    if (localErrno == EAGAIN &&
        std::chrono::steady_clock::now() < deadline) {
      // The listener's backlog is full, give it a moment to accept
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }
    if (localErrno == EAGAIN) {
      localErrno = ETIMEDOUT;
    }
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }

  if (result < 0) {
    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(sockFd, &fdset);
    auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
        deadline - std::chrono::steady_clock::now());
    timeval tv;
    tv.tv_sec = std::max<int64_t>(0, remaining.count() / 1000000);
    tv.tv_usec = std::max<int64_t>(0, remaining.count() % 1000000);
    VLOG(4) << "Before selecting sockFd";
    select(sockFd + 1, NULL, &fdset, NULL, &tv);

    int so_error = ETIMEDOUT;
    if (FD_ISSET(sockFd, &fdset)) {
      VLOG(4) << "sockFd " << sockFd << " is selected";
      socklen_t len = sizeof so_error;
      FATAL_FAIL(
          ::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len));
    }
    if (so_error != 0) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << so_error << " "
                << strerror(so_error);
      FATAL_FAIL(::close(sockFd));
      SetErrno(so_error);
      return -1;
    }
  }

  LOG(INFO) << "Connected to endpoint " << endpoint << " with fd " << sockFd;
  addToActiveSockets(sockFd);
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local;
  if (!fillSocketAddress(pipePath, &local)) {
    LOG(WARNING) << "Invalid socket path: " << endpoint;
    SetErrno(ENAMETOOLONG);
    return set<int>();
  }

  string lockPath = getLockPath(pipePath);
  int lockFd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC |
                                            O_NOFOLLOW,
                      S_IRUSR | S_IWUSR);
  if (lockFd < 0) {
    auto localErrno = GetErrno();
    LOG(INFO) << "Cannot open lock file " << lockPath << ": "
              << strerror(localErrno);
    SetErrno(localErrno);
    return set<int>();
  }
  if (::flock(lockFd, LOCK_EX | LOCK_NB) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(lockFd));
    if (localErrno == EWOULDBLOCK) {
      LOG(INFO) << "Another process owns " << endpoint;
      localErrno = EADDRINUSE;
    } else {
      LOG(INFO) << "Cannot lock " << lockPath << ": " << strerror(localErrno);
    }
    SetErrno(localErrno);
    return set<int>();
  }

  // The path is ours now.  A socket file that is still there belongs to an
  // instance that died without cleaning up.
  struct stat existing;
  if (::lstat(local.sun_path, &existing) == 0 && !S_ISSOCK(existing.st_mode)) {
    LOG(WARNING) << "Refusing to replace non-socket file " << endpoint;
    FATAL_FAIL(::close(lockFd));
    SetErrno(EEXIST);
    return set<int>();
  }
  if (::unlink(local.sun_path) == -1 && GetErrno() != ENOENT) {
    auto localErrno = GetErrno();
    LOG(INFO) << "Cannot remove stale socket " << endpoint << ": "
              << strerror(localErrno);
    FATAL_FAIL(::close(lockFd));
    SetErrno(localErrno);
    return set<int>();
  }

  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);
  if (::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)) == -1 ||
      ::listen(fd, 5) == -1) {
    auto localErrno = GetErrno();
    LOG(INFO) << "Cannot listen on " << endpoint << ": "
              << strerror(localErrno);
    FATAL_FAIL(::close(fd));
    FATAL_FAIL(::close(lockFd));
    SetErrno(localErrno);
    return set<int>();
  }
  if (::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR) == -1) {
    LOG(WARNING) << "Cannot restrict permissions of " << endpoint << ": "
                 << strerror(GetErrno());
  }

  LOG(INFO) << "Listening on " << endpoint << " with fd " << fd;
  pipeServerSockets[pipePath] = set<int>({fd});
  pipeLockFds[pipePath] = lockFd;
  return pipeServerSockets[pipePath];
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    STFATAL << "Tried to stop listening to a pipe that we weren't listening on:"
            << pipePath;
  }
  // Remove the file while we still hold the lock, so nobody can bind a new
  // socket that we would then delete.
  if (::unlink(pipePath.c_str()) == -1 && GetErrno() != ENOENT) {
    LOG(WARNING) << "Cannot remove socket " << endpoint << ": "
                 << strerror(GetErrno());
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  pipeServerSockets.erase(it);

  auto lockIt = pipeLockFds.find(pipePath);
  if (lockIt != pipeLockFds.end()) {
    // Closing the last descriptor releases the flock.  The lock file itself
    // stays so every process keeps locking the same inode.
    FATAL_FAIL(::close(lockIt->second));
    pipeLockFds.erase(lockIt);
  }
  LOG(INFO) << "Stopped listening on " << endpoint;
}
}  // namespace cm
