#ifndef __CM_IPC_SERVER_COMMUNICATOR_H__
#define __CM_IPC_SERVER_COMMUNICATOR_H__

#include "IpcCommunicator.hpp"

namespace cm {
/**
 * @brief The single instance that other launches hand their arguments to.
 *
 * Holds the listening socket (and, through the socket handler, the exclusive
 * lock on its path) until closed.  A server created without an endpoint is
 * unbound: listen() and close() only log.
 *
 * The accept loop select()s on the listening socket and every open
 * connection together, so one slow or silent client never keeps the others
 * waiting in the listen backlog.  A connection that delivers no complete
 * frame within the idle timeout is dropped.
 */
class IpcServerCommunicator : public IpcCommunicator {
 public:
  IpcServerCommunicator(shared_ptr<PipeSocketHandler> _socketHandler,
                        const SocketEndpoint& _endpoint, int _serverFd);
  /** @brief Creates an unbound server. */
  explicit IpcServerCommunicator(shared_ptr<PipeSocketHandler> _socketHandler);
  virtual ~IpcServerCommunicator();

  virtual bool isClient() const { return false; }

  virtual void listen(shared_ptr<IpcMessageListener> listener,
                      shared_ptr<ThreadPool> runner);

  inline bool isBound() const { return endpoint.has_value(); }

  /** @brief Must be called before listen(). */
  inline void setConnectionIdleTimeout(std::chrono::milliseconds timeout) {
    connectionIdleTimeout = timeout;
  }

  /** @brief Open connections at once; later clients wait in the backlog. */
  static constexpr size_t MAX_CONNECTIONS = 64;

 protected:
  virtual void closeEndpoint();

  void acceptLoop(shared_ptr<IpcMessageListener> listener);
  /**
   * @brief Reads one frame from a readable connection and dispatches it.
   * @return false when the connection is finished and must be closed.
   */
  bool handleFrame(int clientFd, shared_ptr<IpcMessageListener> listener);

  optional<SocketEndpoint> endpoint;
  int serverFd;
  bool listening;
  std::atomic<bool> halt;
  std::chrono::milliseconds connectionIdleTimeout;
  std::future<void> listenerFuture;
  std::atomic<std::thread::id> listenerThreadId;
};
}  // namespace cm

#endif  // __CM_IPC_SERVER_COMMUNICATOR_H__
