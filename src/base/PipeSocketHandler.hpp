#ifndef __CM_PIPE_SOCKET_HANDLER__
#define __CM_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace cm {
/**
 * @brief Handles UNIX domain socket connections addressed by a filesystem
 * path.
 *
 * Listening is exclusive: a server first takes a non-blocking flock() on
 * "<path>.lock" and only then replaces whatever socket file is left at the
 * path.  The lock is held until stopListening() (or process death), so two
 * processes can never both bind the same path.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  /**
   * @param _connectTimeout How long connect() keeps retrying a listener whose
   * backlog is full before it gives up with ETIMEDOUT.
   */
  explicit PipeSocketHandler(
      std::chrono::milliseconds _connectTimeout = std::chrono::seconds(3));
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to a pipe identified by the endpoint name.
   *
   * ENOENT and ECONNREFUSED in errno mean that nobody is listening; anything
   * else is a hard failure for this path.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Acquires the path exclusively and creates a listening socket.
   *
   * Returns an empty set when the path could not be acquired.  errno is
   * EADDRINUSE when another process holds the path.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  /**
   * @brief Removes the socket file, closes the listening fd and releases the
   * exclusive lock so another process can listen on the path.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

  /** @brief Path of the lock file guarding the given socket path. */
  static string getLockPath(const string& pipePath);

 protected:
  /**
   * @brief Fills a sockaddr_un for the path.
   * @return false when the path does not fit into sun_path.
   */
  static bool fillSocketAddress(const string& pipePath, sockaddr_un* address);

  /** @brief Tracks path -> listening socket descriptors for each pipe. */
  map<string, set<int>> pipeServerSockets;
  /** @brief Tracks path -> descriptor holding the flock for each pipe. */
  map<string, int> pipeLockFds;
  std::chrono::milliseconds connectTimeout;
};
}  // namespace cm

#endif  // __CM_PIPE_SOCKET_HANDLER__
