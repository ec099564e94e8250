#ifndef __CM_IPC_COMMUNICATOR_H__
#define __CM_IPC_COMMUNICATOR_H__

#include "Headers.hpp"
#include "IpcErrors.hpp"
#include "IpcMessage.hpp"
#include "IpcMessageListener.hpp"
#include "PipeSocketHandler.hpp"

namespace cm {
/**
 * @brief Owns the endpoint this process uses to coordinate with other
 * launcher instances.
 *
 * The role is decided once by create() and never changes: a client holds a
 * connection to the running instance, a server holds the listening socket and
 * the exclusive lock on its path.  close() releases whatever the role holds
 * and is safe to call any number of times from any thread.
 */
class IpcCommunicator {
 public:
  /**
   * @brief Walks the candidates in order and returns a communicator for the
   * first one that yields a role.
   *
   * An empty list yields an unbound server that never hears from other
   * instances.
   * @throws EndpointError when no candidate could be used.
   */
  static shared_ptr<IpcCommunicator> create(
      shared_ptr<PipeSocketHandler> socketHandler,
      const vector<SocketEndpoint>& candidates);

  virtual ~IpcCommunicator() {}

  virtual bool isClient() const = 0;

  /** @brief Asks the running instance to open the given arguments. */
  virtual void sendHandleLaunchArgs(const vector<string>& args);
  /** @brief Asks the running instance to bring its window to the front. */
  virtual void sendRevealRunningApp();
  /**
   * @brief Starts accepting connections from other instances.
   *
   * The accept loop runs on `runner` and hands every decoded message to
   * `listener`.
   */
  virtual void listen(shared_ptr<IpcMessageListener> listener,
                      shared_ptr<ThreadPool> runner);

  /** @brief Releases the endpoint.  Later calls do nothing. */
  void close();
  /** @brief Same as close(), but failures are only logged. */
  void closeUnchecked();

  inline bool isClosed() {
    lock_guard<std::mutex> guard(stateMutex);
    return closed;
  }

 protected:
  IpcCommunicator(shared_ptr<PipeSocketHandler> _socketHandler);

  /** @brief Role specific release, called at most once by close(). */
  virtual void closeEndpoint() = 0;

  /** @brief Throws RoleError if the communicator was closed. */
  void checkOpen(const string& operation);

  static shared_ptr<IpcCommunicator> tryEndpoint(
      shared_ptr<PipeSocketHandler> socketHandler,
      const SocketEndpoint& endpoint, vector<string>* failures);

  shared_ptr<PipeSocketHandler> socketHandler;
  bool closed;
  std::mutex stateMutex;
};
}  // namespace cm

#endif  // __CM_IPC_COMMUNICATOR_H__
